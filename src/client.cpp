#include "raptorboost/client.hpp"

#include "raptorboost/consts.hpp"
#include "raptorboost/errors.hpp"

#include <cerrno>
#include <netdb.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace {

[[nodiscard]] auto gai_error_to_exception(int rc, std::string_view where, std::string_view host,
                                          int port) -> std::runtime_error {
  std::ostringstream os;
  os << where << " failed for " << host << ":" << port << ": " << gai_strerror(rc);
  return std::runtime_error(os.str());
}

[[nodiscard]] auto connect_tcp(const std::string &host, int port) -> raptorboost::fs::UniqueFd {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = 0;
  hints.ai_protocol = 0;

  addrinfo *res = nullptr;
  const std::string port_s = std::to_string(port);

  if (const int rc = ::getaddrinfo(host.c_str(), port_s.c_str(), &hints, &res); rc != 0) {
    throw gai_error_to_exception(rc, "getaddrinfo", host, port);
  }

  raptorboost::fs::UniqueFd sock;
  for (addrinfo *rp = res; rp != nullptr; rp = rp->ai_next) {
    const int fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
    if (fd == -1) {
      continue;
    }
    if (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0) {
      sock.reset(fd);
      break;
    }
    const int saved = errno;
    ::close(fd);
    // try next addr; if none succeed, we throw below with the last errno
    errno = saved;
  }
  const int saved_errno = errno; // preserve before freeaddrinfo
  ::freeaddrinfo(res);

  if (!sock) {
    throw std::system_error(saved_errno, std::generic_category(), "connect");
  }
  return sock;
}

[[nodiscard]] auto as_bytes(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

// Reads one reply line, turning ERR replies into exceptions.
[[nodiscard]] auto expect_reply(raptorboost::wire::Connection &conn) -> std::string {
  std::string line = conn.expect_line();
  raptorboost::wire::throw_if_error(line);
  return line;
}

} // namespace

namespace raptorboost {

void FileDataSender::first(std::string_view hex, bool force, std::span<const std::uint8_t> bytes) {
  conn_->send_line(std::string(consts::kTokFirst) + std::string(hex) + (force ? " 1 " : " 0 ") +
                   std::to_string(bytes.size()));
  conn_->send_all(bytes);
}

void FileDataSender::data(std::span<const std::uint8_t> bytes) {
  conn_->send_line(std::string(consts::kTokData) + std::to_string(bytes.size()));
  conn_->send_all(bytes);
}

SendStatus FileDataSender::finish() {
  conn_->send_line(consts::kTokEnd);
  const std::string line = expect_reply(*conn_);
  if (!line.starts_with(consts::kTokStatus)) {
    throw ProtocolError("expected STATUS, got: " + line);
  }
  return wire::send_status_from_string(std::string_view(line).substr(consts::kTokStatus.size()));
}

Client Client::connect(const std::string &host, int port) {
  wire::Connection conn{connect_tcp(host, port)};
  conn.send_line(consts::kHelloLine);
  const std::string hello = expect_reply(conn);
  if (hello != consts::kHelloLine) {
    throw ProtocolError("server did not answer HELLO: " + hello);
  }
  return Client{std::move(conn)};
}

auto Client::get_version() -> std::string {
  conn_.send_line(consts::kOpVersion);
  const std::string line = expect_reply(conn_);
  if (!line.starts_with(consts::kTokVersion)) {
    throw ProtocolError("expected VERSION, got: " + line);
  }
  return line.substr(consts::kTokVersion.size());
}

auto Client::upload_files(const std::vector<std::string> &digests) -> std::vector<FileState> {
  std::string req(consts::kOpUpload);
  req += std::to_string(digests.size());
  req += '\n';
  for (const auto &d : digests) {
    req += d;
    req += '\n';
  }
  conn_.send_all(as_bytes(req));

  std::vector<FileState> out;
  out.reserve(digests.size());
  for (std::size_t i = 0; i < digests.size(); ++i) {
    out.push_back(wire::parse_file_state(expect_reply(conn_)));
  }
  return out;
}

auto Client::send_file_data() -> FileDataSender {
  conn_.send_line(consts::kOpSend);
  return FileDataSender{conn_};
}

auto Client::assign_names(const std::optional<std::string> &transfer, bool force,
                          const std::vector<Sha256Filenames> &entries) -> AssignNamesResult {
  std::string req(consts::kOpAssign);
  req += transfer ? *transfer : std::string(consts::kNoTransfer);
  req += force ? " 1 " : " 0 ";
  req += std::to_string(entries.size());
  req += '\n';
  for (const auto &e : entries) {
    req += std::string(consts::kTokDigest) + e.sha256sum + " " + std::to_string(e.names.size());
    req += '\n';
    for (const auto &name : e.names) {
      req += name;
      req += '\n';
    }
  }
  conn_.send_all(as_bytes(req));

  AssignNamesResult result;
  const std::string tline = expect_reply(conn_);
  if (!tline.starts_with(consts::kTokTransfer)) {
    throw ProtocolError("expected TRANSFER, got: " + tline);
  }
  result.transfer = tline.substr(consts::kTokTransfer.size());

  for (;;) {
    const std::string line = expect_reply(conn_);
    if (line == consts::kTokDone) {
      break;
    }
    if (!line.starts_with(consts::kTokName)) {
      throw ProtocolError("expected NAME, got: " + line);
    }
    const auto parts = wire::split(std::string_view(line).substr(consts::kTokName.size()), 2);
    if (parts.size() != 2) {
      throw ProtocolError("malformed NAME line: " + line);
    }
    result.statuses.push_back(NameStatus{.name = std::string(parts[1]),
                                         .status = wire::assign_name_status_from_string(parts[0]),
                                         .error = {}});
  }
  return result;
}

} // namespace raptorboost
