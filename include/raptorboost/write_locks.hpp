#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace raptorboost {

class WriteLocks;

// Exclusive right to write one digest. Released on destruction.
class WriteLease {
public:
  WriteLease() = default;
  WriteLease(WriteLease &&other) noexcept;
  auto operator=(WriteLease &&other) noexcept -> WriteLease &;
  WriteLease(const WriteLease &) = delete;
  auto operator=(const WriteLease &) -> WriteLease & = delete;
  ~WriteLease();

  [[nodiscard]] auto hex() const -> const std::string & { return hex_; }
  [[nodiscard]] explicit operator bool() const noexcept { return owner_ != nullptr; }

  void release() noexcept;

private:
  friend class WriteLocks;
  WriteLease(WriteLocks *owner, std::string hex) : owner_{owner}, hex_{std::move(hex)} {}

  WriteLocks *owner_{nullptr};
  std::string hex_;
};

// At most one writer per digest. Entries exist only while a lease is held.
class WriteLocks {
public:
  WriteLocks() = default;
  WriteLocks(const WriteLocks &) = delete;
  auto operator=(const WriteLocks &) -> WriteLocks & = delete;

  // nullopt if another lease for `hex` is alive.
  [[nodiscard]] auto try_acquire(std::string_view hex) -> std::optional<WriteLease>;

  [[nodiscard]] auto is_held(std::string_view hex) const -> bool;
  [[nodiscard]] auto held_count() const -> std::size_t;

private:
  friend class WriteLease;
  void release(const std::string &hex) noexcept;

  mutable std::mutex mutex_;
  std::unordered_set<std::string> held_;
};

} // namespace raptorboost
