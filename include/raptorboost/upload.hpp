#pragma once
#include "raptorboost/object_store.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace raptorboost {

enum class FileStateResult { Unspecified, NeedMoreData, Complete };

struct FileState {
  std::string sha256sum;
  FileStateResult state{FileStateResult::Unspecified};
  std::optional<std::uint64_t> offset; // resume point, only for NeedMoreData
};

// Terminal status of an ingest stream. Refers to the last digest only.
enum class SendStatus { Unspecified, Complete, ErrorChecksum };

/**
 * State machine for one ingest stream. The stream is a sequence of
 *   first(digest, force, bytes)  -- finalizes the previous digest, starts a new one
 *   data(bytes)                  -- appends to the digest started last
 * ended by finish() (sender closed the stream: finalize the active digest)
 * or abandon() (connection lost: active digest stays Partial).
 */
class IngestSession {
public:
  explicit IngestSession(ContentStore &store) : store_{&store} {}

  void first(std::string_view hex, bool force, std::span<const std::uint8_t> bytes);
  void data(std::span<const std::uint8_t> bytes);
  SendStatus finish();
  void abandon() noexcept;

  [[nodiscard]] auto active_digest() const -> std::optional<std::string>;

private:
  struct NoActiveDigest {};
  struct Writing {
    ObjectWriter writer;
  };
  // Already complete and not forced: bytes are accepted and dropped.
  struct Discarding {
    std::string hex;
  };

  void finalize_active();

  ContentStore *store_;
  std::variant<NoActiveDigest, Writing, Discarding> slot_;
  SendStatus last_{SendStatus::Unspecified};
};

class UploadCoordinator {
public:
  explicit UploadCoordinator(ContentStore &store) : store_{store} {}

  // One FileState per requested digest, in request order.
  [[nodiscard]] auto negotiate(const std::vector<std::string> &digests) const
      -> std::vector<FileState>;

  [[nodiscard]] auto open_ingest() const -> IngestSession { return IngestSession{store_}; }

private:
  ContentStore &store_;
};

} // namespace raptorboost
