#include "raptorboost/write_locks.hpp"

#include <utility>

namespace raptorboost {

WriteLease::WriteLease(WriteLease &&other) noexcept
    : owner_{std::exchange(other.owner_, nullptr)}, hex_{std::move(other.hex_)} {}

auto WriteLease::operator=(WriteLease &&other) noexcept -> WriteLease & {
  if (this != &other) {
    release();
    owner_ = std::exchange(other.owner_, nullptr);
    hex_ = std::move(other.hex_);
  }
  return *this;
}

WriteLease::~WriteLease() { release(); }

void WriteLease::release() noexcept {
  if (owner_ != nullptr) {
    owner_->release(hex_);
    owner_ = nullptr;
  }
}

auto WriteLocks::try_acquire(std::string_view hex) -> std::optional<WriteLease> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = held_.emplace(hex);
  if (!inserted) {
    return std::nullopt;
  }
  return WriteLease{this, *it};
}

auto WriteLocks::is_held(std::string_view hex) const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_.contains(std::string(hex));
}

auto WriteLocks::held_count() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_.size();
}

void WriteLocks::release(const std::string &hex) noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  held_.erase(hex);
}

} // namespace raptorboost
