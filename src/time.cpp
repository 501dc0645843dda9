#include "raptorboost/time.hpp"

#include <array>
#include <stdexcept>

namespace raptorboost::timeutil {

std::string compact_utc_timestamp(std::time_t t) {
  std::tm gt{};
  if (gmtime_r(&t, &gt) == nullptr) {
    throw std::runtime_error("gmtime_r failed");
  }
  std::array<char, 32> buf{};
  const std::size_t n = std::strftime(buf.data(), buf.size(), "%Y%m%d-%H%M%S", &gt);
  return std::string(buf.data(), n);
}

} // namespace raptorboost::timeutil
