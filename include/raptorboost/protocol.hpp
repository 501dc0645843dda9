#pragma once
#include "raptorboost/errors.hpp"
#include "raptorboost/fs.hpp"
#include "raptorboost/naming.hpp"
#include "raptorboost/upload.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace raptorboost::wire {

// Peer went away (EOF or reset) in the middle of a message.
class ConnectionClosed : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class ErrorKind { Invalid, Conflict, Precondition, Protocol, Internal };

// An "ERR <KIND> <message>" reply.
class RemoteError : public Error {
public:
  RemoteError(ErrorKind kind, const std::string &message) : Error(message), kind_{kind} {}
  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }
  [[nodiscard]] auto retryable() const noexcept -> bool { return kind_ == ErrorKind::Conflict; }

private:
  ErrorKind kind_;
};

// Line + length-prefixed payload framing over a stream socket.
class Connection {
public:
  explicit Connection(fs::UniqueFd fd);

  [[nodiscard]] auto fd() const noexcept -> int { return fd_.get(); }

  void send_all(std::span<const std::uint8_t> data);
  void send_line(std::string_view s);

  // nullopt on a clean EOF before the first byte of the line.
  [[nodiscard]] auto recv_line() -> std::optional<std::string>;
  // Like recv_line, but EOF is a ConnectionClosed error.
  [[nodiscard]] auto expect_line() -> std::string;
  void recv_exact(std::uint8_t *dst, std::size_t n);

  // Half-closes and discards input until the peer closes, so a final reply
  // is not lost to a reset. Bounded by `timeout` and `max_bytes`.
  void linger_close(std::chrono::milliseconds timeout, std::size_t max_bytes) noexcept;

private:
  auto fill() -> bool;

  fs::UniqueFd fd_;
  std::vector<std::uint8_t> buf_;
  std::size_t pos_{0};
  std::size_t len_{0};
};

inline constexpr std::size_t kMaxLineBytes = 64 * 1024;

auto to_string(ErrorKind kind) -> std::string_view;
auto error_kind_from_string(std::string_view s) -> ErrorKind;
// Which wire kind reports a given failure.
auto classify(const std::exception &e) -> ErrorKind;

auto to_string(SendStatus s) -> std::string_view;
auto send_status_from_string(std::string_view s) -> SendStatus;

auto to_string(AssignNameStatus s) -> std::string_view;
auto assign_name_status_from_string(std::string_view s) -> AssignNameStatus;

// "STATE <hex> COMPLETE" | "STATE <hex> NEED_MORE_DATA <offset>"
auto format_file_state(const FileState &st) -> std::string;
auto parse_file_state(std::string_view line) -> FileState;

// Parses a decimal u64 token; ProtocolError if malformed.
auto parse_u64(std::string_view token) -> std::uint64_t;
auto parse_flag(std::string_view token) -> bool;

// Splits on single spaces into at most max_parts pieces; the last piece keeps
// the remainder of the line.
auto split(std::string_view line, std::size_t max_parts) -> std::vector<std::string_view>;

// Throws RemoteError if the line is an ERR reply.
void throw_if_error(std::string_view line);

} // namespace raptorboost::wire
