#include "raptorboost/protocol.hpp"

#include "raptorboost/consts.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>
#include <system_error>

namespace raptorboost::wire {

Connection::Connection(fs::UniqueFd fd) : fd_{std::move(fd)}, buf_(64 * 1024) {}

void Connection::send_all(std::span<const std::uint8_t> data) {
  const std::uint8_t *p = data.data();
  std::size_t n = data.size();
  while (n != 0U) {
    const ssize_t w = ::send(fd_.get(), p, n, MSG_NOSIGNAL);
    if (w < 0 && errno == EINTR) {
      continue;
    }
    if (w <= 0) {
      throw std::system_error(errno, std::generic_category(), "send");
    }
    p += static_cast<std::size_t>(w);
    n -= static_cast<std::size_t>(w);
  }
}

void Connection::send_line(std::string_view s) {
  std::string t(s);
  t.push_back('\n');
  send_all(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(t.data()), t.size()));
}

auto Connection::fill() -> bool {
  pos_ = 0;
  len_ = 0;
  for (;;) {
    const ssize_t r = ::recv(fd_.get(), buf_.data(), buf_.size(), 0);
    if (r < 0 && errno == EINTR) {
      continue;
    }
    if (r < 0) {
      if (errno == ECONNRESET) {
        return false;
      }
      throw std::system_error(errno, std::generic_category(), "recv");
    }
    len_ = static_cast<std::size_t>(r);
    return r > 0;
  }
}

auto Connection::recv_line() -> std::optional<std::string> {
  std::string s;
  for (;;) {
    if (pos_ == len_ && !fill()) {
      if (s.empty()) {
        return std::nullopt;
      }
      throw ConnectionClosed("connection closed mid-line");
    }
    const auto *begin = buf_.data() + pos_;
    const auto *end = buf_.data() + len_;
    const auto *nl = std::find(begin, end, static_cast<std::uint8_t>('\n'));
    s.append(reinterpret_cast<const char *>(begin), static_cast<std::size_t>(nl - begin));
    if (s.size() > kMaxLineBytes) {
      throw ProtocolError("line too long");
    }
    if (nl != end) {
      pos_ += static_cast<std::size_t>(nl - begin) + 1;
      return s;
    }
    pos_ = len_;
  }
}

auto Connection::expect_line() -> std::string {
  auto line = recv_line();
  if (!line) {
    throw ConnectionClosed("connection closed");
  }
  return std::move(*line);
}

void Connection::recv_exact(std::uint8_t *dst, std::size_t n) {
  std::size_t got = 0;
  while (got < n) {
    if (pos_ == len_ && !fill()) {
      throw ConnectionClosed("connection closed mid-payload");
    }
    const std::size_t take = std::min(n - got, len_ - pos_);
    std::memcpy(dst + got, buf_.data() + pos_, take);
    pos_ += take;
    got += take;
  }
}

void Connection::linger_close(std::chrono::milliseconds timeout, std::size_t max_bytes) noexcept {
  ::shutdown(fd_.get(), SHUT_WR);
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  ::setsockopt(fd_.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  std::size_t drained = 0;
  while (drained < max_bytes) {
    const ssize_t r = ::recv(fd_.get(), buf_.data(), buf_.size(), 0);
    if (r < 0 && errno == EINTR) {
      continue;
    }
    if (r <= 0) {
      break;
    }
    drained += static_cast<std::size_t>(r);
  }
  pos_ = 0;
  len_ = 0;
}

auto to_string(ErrorKind kind) -> std::string_view {
  switch (kind) {
  case ErrorKind::Invalid:
    return "INVALID";
  case ErrorKind::Conflict:
    return "CONFLICT";
  case ErrorKind::Precondition:
    return "PRECONDITION";
  case ErrorKind::Protocol:
    return "PROTOCOL";
  case ErrorKind::Internal:
    break;
  }
  return "INTERNAL";
}

auto error_kind_from_string(std::string_view s) -> ErrorKind {
  if (s == "INVALID")
    return ErrorKind::Invalid;
  if (s == "CONFLICT")
    return ErrorKind::Conflict;
  if (s == "PRECONDITION")
    return ErrorKind::Precondition;
  if (s == "PROTOCOL")
    return ErrorKind::Protocol;
  return ErrorKind::Internal;
}

auto classify(const std::exception &e) -> ErrorKind {
  if (dynamic_cast<const InvalidDigest *>(&e) != nullptr ||
      dynamic_cast<const InvalidName *>(&e) != nullptr) {
    return ErrorKind::Invalid;
  }
  if (dynamic_cast<const WriteConflict *>(&e) != nullptr) {
    return ErrorKind::Conflict;
  }
  if (dynamic_cast<const PreconditionFailed *>(&e) != nullptr) {
    return ErrorKind::Precondition;
  }
  if (dynamic_cast<const ProtocolError *>(&e) != nullptr) {
    return ErrorKind::Protocol;
  }
  return ErrorKind::Internal;
}

auto to_string(SendStatus s) -> std::string_view {
  switch (s) {
  case SendStatus::Complete:
    return "COMPLETE";
  case SendStatus::ErrorChecksum:
    return "ERROR_CHECKSUM";
  case SendStatus::Unspecified:
    break;
  }
  return "UNSPECIFIED";
}

auto send_status_from_string(std::string_view s) -> SendStatus {
  if (s == "COMPLETE")
    return SendStatus::Complete;
  if (s == "ERROR_CHECKSUM")
    return SendStatus::ErrorChecksum;
  if (s == "UNSPECIFIED")
    return SendStatus::Unspecified;
  throw ProtocolError("unknown send status: " + std::string(s));
}

auto to_string(AssignNameStatus s) -> std::string_view {
  switch (s) {
  case AssignNameStatus::Success:
    return "SUCCESS";
  case AssignNameStatus::AlreadyExists:
    return "ALREADY_EXISTS";
  case AssignNameStatus::Unspecified:
    break;
  }
  return "UNSPECIFIED";
}

auto assign_name_status_from_string(std::string_view s) -> AssignNameStatus {
  if (s == "SUCCESS")
    return AssignNameStatus::Success;
  if (s == "ALREADY_EXISTS")
    return AssignNameStatus::AlreadyExists;
  if (s == "UNSPECIFIED")
    return AssignNameStatus::Unspecified;
  throw ProtocolError("unknown name status: " + std::string(s));
}

auto format_file_state(const FileState &st) -> std::string {
  std::string s(consts::kTokState);
  s += st.sha256sum;
  if (st.state == FileStateResult::Complete) {
    s += " COMPLETE";
  } else {
    s += " NEED_MORE_DATA ";
    s += std::to_string(st.offset.value_or(0));
  }
  return s;
}

auto parse_file_state(std::string_view line) -> FileState {
  if (!line.starts_with(consts::kTokState)) {
    throw ProtocolError("expected STATE line, got: " + std::string(line));
  }
  const auto parts = split(line.substr(consts::kTokState.size()), 3);
  if (parts.size() < 2) {
    throw ProtocolError("malformed STATE line: " + std::string(line));
  }
  FileState st;
  st.sha256sum = std::string(parts[0]);
  if (parts[1] == "COMPLETE" && parts.size() == 2) {
    st.state = FileStateResult::Complete;
  } else if (parts[1] == "NEED_MORE_DATA") {
    st.state = FileStateResult::NeedMoreData;
    st.offset = parts.size() == 3 ? parse_u64(parts[2]) : 0;
  } else {
    throw ProtocolError("malformed STATE line: " + std::string(line));
  }
  return st;
}

auto parse_u64(std::string_view token) -> std::uint64_t {
  std::uint64_t v = 0;
  const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), v);
  if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size()) {
    throw ProtocolError("bad number: '" + std::string(token) + "'");
  }
  return v;
}

auto parse_flag(std::string_view token) -> bool {
  if (token == "1")
    return true;
  if (token == "0")
    return false;
  throw ProtocolError("bad flag: '" + std::string(token) + "'");
}

auto split(std::string_view line, std::size_t max_parts) -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  while (!line.empty() && parts.size() + 1 < max_parts) {
    const auto sp = line.find(' ');
    if (sp == std::string_view::npos) {
      break;
    }
    parts.push_back(line.substr(0, sp));
    line.remove_prefix(sp + 1);
  }
  parts.push_back(line);
  return parts;
}

void throw_if_error(std::string_view line) {
  if (!line.starts_with(consts::kTokErr)) {
    return;
  }
  const auto parts = split(line.substr(consts::kTokErr.size()), 2);
  const std::string message = parts.size() > 1 ? std::string(parts[1]) : std::string{};
  throw RemoteError(error_kind_from_string(parts[0]), message);
}

} // namespace raptorboost::wire
