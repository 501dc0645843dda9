#pragma once
#include "raptorboost/fs.hpp"
#include "raptorboost/write_locks.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace raptorboost {

enum class ObjectState { Missing, Partial, Complete };

struct ObjectStatus {
  ObjectState state{ObjectState::Missing};
  std::uint64_t offset{0}; // staged bytes (Partial) or object size (Complete)
};

enum class FinalizeResult { Complete, ChecksumMismatch };

class ContentStore;

// Stages bytes for one digest while holding its write lease. Dropping an
// unfinished writer keeps the staged bytes (the object stays Partial).
class ObjectWriter {
public:
  ObjectWriter(ObjectWriter &&) noexcept = default;
  auto operator=(ObjectWriter &&) noexcept -> ObjectWriter & = default;

  [[nodiscard]] auto hex() const -> const std::string & { return lease_.hex(); }
  [[nodiscard]] auto offset() const noexcept -> std::uint64_t { return offset_; }

  // Appends at the current end; returns the new offset.
  std::uint64_t append(std::span<const std::uint8_t> bytes);

  // Verifies the staged bytes and promotes them to complete/, or discards
  // them on mismatch. The writer is closed afterwards.
  FinalizeResult finalize();

private:
  friend class ContentStore;
  ObjectWriter(const ContentStore &store, WriteLease lease, fs::UniqueFd fd, std::uint64_t offset)
      : store_{&store}, lease_{std::move(lease)}, fd_{std::move(fd)}, offset_{offset} {}

  const ContentStore *store_;
  WriteLease lease_;
  fs::UniqueFd fd_;
  std::uint64_t offset_;
};

// Digest-keyed object storage with resumable staging.
//   <base>/complete/<hh>/<hex>   verified, immutable objects
//   <base>/partial/<hex>         staged bytes; file size is the resume offset
class ContentStore {
public:
  // base_dir is made absolute; the layout directories are created.
  explicit ContentStore(std::filesystem::path base_dir);

  [[nodiscard]] auto base_dir() const -> const std::filesystem::path & { return base_dir_; }
  [[nodiscard]] auto complete_dir() const -> std::filesystem::path;
  [[nodiscard]] auto partial_dir() const -> std::filesystem::path;

  [[nodiscard]] auto object_path(std::string_view hex) const -> std::filesystem::path;
  [[nodiscard]] auto partial_path(std::string_view hex) const -> std::filesystem::path;

  [[nodiscard]] ObjectStatus query(std::string_view hex) const;

  // Takes the digest's write lease (WriteConflict if held elsewhere).
  // Returns nullopt when the object is already complete and force_restart
  // is unset; bytes left by an abandoned forced restage are dropped then.
  // With force_restart, or without staged bytes, staging starts again at
  // offset 0.
  [[nodiscard]] std::optional<ObjectWriter> open_writer(std::string_view hex, bool force_restart);

  // Single-call forms of open_writer + append / finalize. finalize on a
  // complete object reports Complete and drops any staged bytes.
  std::uint64_t append(std::string_view hex, std::span<const std::uint8_t> bytes,
                       bool force_restart);
  FinalizeResult finalize(std::string_view hex);

  // Re-hash a complete object and compare with its key.
  [[nodiscard]] bool verify(std::string_view hex) const;

  [[nodiscard]] auto locks() const -> const WriteLocks & { return locks_; }

private:
  friend class ObjectWriter;
  FinalizeResult promote(const std::string &hex) const;
  void discard_partial(std::string_view hex) const;

  std::filesystem::path base_dir_;
  WriteLocks locks_;
};

} // namespace raptorboost
