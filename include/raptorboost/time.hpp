#pragma once
#include <ctime>
#include <string>

namespace raptorboost::timeutil {

// "YYYYmmdd-HHMMSS" in UTC, e.g. 20241019-081502
auto compact_utc_timestamp(std::time_t when) -> std::string;

} // namespace raptorboost::timeutil
