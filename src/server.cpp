#include "raptorboost/server.hpp"

#include "raptorboost/consts.hpp"
#include "raptorboost/errors.hpp"
#include "raptorboost/hash.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <netdb.h>
#include <netinet/in.h>
#include <sstream>
#include <string_view>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace {

// Limits for counts announced in request headers.
constexpr std::uint64_t kMaxDigestsPerRequest = 1'000'000;
constexpr std::uint64_t kMaxNamesPerDigest = 1'000'000;

// Input discarded after a fatal error before the connection is closed.
constexpr std::chrono::milliseconds kLingerTimeout{2000};
constexpr std::size_t kLingerMaxBytes = 256ULL * 1024 * 1024;

// One insertion per line so concurrent connections do not interleave.
void log_line(std::ostream &os, const std::string &s) { os << (s + "\n") << std::flush; }

[[nodiscard]] auto one_line(std::string s) -> std::string {
  for (auto &c : s) {
    if (c == '\n' || c == '\r')
      c = ' ';
  }
  return s;
}

[[nodiscard]] auto peer_name(const sockaddr_storage &addr) -> std::string {
  char host[NI_MAXHOST] = {};
  char serv[NI_MAXSERV] = {};
  if (::getnameinfo(reinterpret_cast<const sockaddr *>(&addr), sizeof(addr), host, sizeof(host),
                    serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
    return "?";
  }
  return std::string("[") + host + "]:" + serv;
}

} // namespace

namespace raptorboost {

auto server_version() -> std::string { return RAPTORBOOST_VERSION; }

Server::Server(ServerConfig cfg, ContentStore &store, const TransferNamer &namer)
    : cfg_(std::move(cfg)), store_{store}, namer_{namer}, uploads_{store} {}

Server::~Server() { stop(); }

void Server::listen() {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  addrinfo *res = nullptr;
  const std::string port_s = std::to_string(cfg_.port);
  const char *node = cfg_.host.empty() ? nullptr : cfg_.host.c_str();
  if (const int rc = ::getaddrinfo(node, port_s.c_str(), &hints, &res); rc != 0) {
    throw std::runtime_error("getaddrinfo failed for " + cfg_.host + ":" + port_s + ": " +
                             gai_strerror(rc));
  }

  fs::UniqueFd sock;
  int saved_errno = 0;
  for (addrinfo *rp = res; rp != nullptr; rp = rp->ai_next) {
    fs::UniqueFd fd{::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol)};
    if (!fd) {
      saved_errno = errno;
      continue;
    }
    int yes = 1;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    if (::bind(fd.get(), rp->ai_addr, rp->ai_addrlen) == 0 && ::listen(fd.get(), 64) == 0) {
      sock = std::move(fd);
      break;
    }
    saved_errno = errno;
  }
  ::freeaddrinfo(res);

  if (!sock) {
    throw std::system_error(saved_errno, std::generic_category(),
                            "bind " + cfg_.host + ":" + port_s);
  }

  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(sock.get(), reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
    throw std::system_error(errno, std::generic_category(), "getsockname");
  }
  port_ = addr.ss_family == AF_INET6 ? ntohs(reinterpret_cast<sockaddr_in6 *>(&addr)->sin6_port)
                                     : ntohs(reinterpret_cast<sockaddr_in *>(&addr)->sin_port);
  listen_fd_ = std::move(sock);
}

void Server::run() {
  if (!listen_fd_) {
    throw std::logic_error("serve: run() before listen()");
  }
  std::ostringstream os;
  os << "raptorboost " << server_version() << " listening on " << cfg_.host << " port " << port_
     << ", storing in " << store_.base_dir();
  log_line(std::cout, os.str());

  while (!stopping_) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    const int cfd = ::accept4(listen_fd_.get(), reinterpret_cast<sockaddr *>(&addr), &len,
                              SOCK_CLOEXEC);
    if (cfd < 0) {
      if (stopping_) {
        break;
      }
      if (errno == EINTR || errno == ECONNABORTED || errno == EMFILE || errno == ENFILE) {
        log_line(std::cerr, std::string("serve: accept: ") + std::strerror(errno));
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "accept");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished();
    if (stopping_) {
      ::close(cfd);
      break;
    }
    const std::uint64_t id = next_worker_++;
    client_fds_.insert(cfd);
    workers_.emplace(id, std::thread([this, id, cfd, peer = peer_name(addr)]() {
      {
        wire::Connection conn{fs::UniqueFd{cfd}};
        try {
          serve_connection(conn, peer);
        } catch (const std::exception &e) {
          log_line(std::cerr, "serve: " + peer + ": " + e.what());
        }
        std::lock_guard<std::mutex> inner(mutex_);
        client_fds_.erase(cfd);
      }
      std::lock_guard<std::mutex> inner(mutex_);
      finished_.push_back(id);
    }));
  }
}

void Server::stop() {
  std::map<std::uint64_t, std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_.exchange(true)) {
      return;
    }
    if (listen_fd_) {
      ::shutdown(listen_fd_.get(), SHUT_RDWR);
    }
    for (const int fd : client_fds_) {
      ::shutdown(fd, SHUT_RDWR);
    }
    workers.swap(workers_);
    finished_.clear();
  }
  for (auto &[id, t] : workers) {
    if (t.joinable()) {
      t.join();
    }
  }
}

// Caller holds mutex_.
void Server::reap_finished() {
  for (const auto id : finished_) {
    auto it = workers_.find(id);
    if (it != workers_.end()) {
      it->second.join();
      workers_.erase(it);
    }
  }
  finished_.clear();
}

void Server::serve_connection(wire::Connection &conn, const std::string &peer) {
  const auto hello = conn.recv_line();
  if (!hello) {
    return;
  }
  if (*hello != consts::kHelloLine) {
    conn.send_line(std::string(consts::kTokErr) + "PROTOCOL expected " +
                   std::string(consts::kHelloLine));
    conn.linger_close(kLingerTimeout, kLingerMaxBytes);
    return;
  }
  conn.send_line(consts::kHelloLine);

  while (auto line = conn.recv_line()) {
    const std::string &op = *line;
    try {
      if (op == consts::kOpVersion) {
        handle_version(conn);
      } else if (op.starts_with(consts::kOpUpload)) {
        handle_upload(conn, std::string_view(op).substr(consts::kOpUpload.size()));
      } else if (op == consts::kOpSend) {
        handle_send(conn, peer);
      } else if (op.starts_with(consts::kOpAssign)) {
        handle_assign(conn, std::string_view(op).substr(consts::kOpAssign.size()), peer);
      } else {
        throw ProtocolError("unknown operation: " + op);
      }
    } catch (const wire::ConnectionClosed &) {
      throw;
    } catch (const std::exception &e) {
      const auto kind = wire::classify(e);
      log_line(std::cerr, "serve: " + peer + ": " + one_line(op) + ": " + e.what());
      conn.send_line(std::string(consts::kTokErr) + std::string(wire::to_string(kind)) + " " +
                     one_line(e.what()));
      // the rest of a failed stream (or of an unparsable request) is unreadable
      if (kind == wire::ErrorKind::Protocol || kind == wire::ErrorKind::Internal ||
          op == consts::kOpSend) {
        conn.linger_close(kLingerTimeout, kLingerMaxBytes);
        return;
      }
    }
  }
}

void Server::handle_version(wire::Connection &conn) {
  conn.send_line(std::string(consts::kTokVersion) + server_version());
}

void Server::handle_upload(wire::Connection &conn, std::string_view args) {
  const std::uint64_t n = wire::parse_u64(args);
  if (n > kMaxDigestsPerRequest) {
    throw ProtocolError("too many digests in one request");
  }
  std::vector<std::string> digests;
  digests.reserve(n);
  for (std::uint64_t i = 0; i < n; ++i) {
    digests.push_back(conn.expect_line());
  }

  for (const auto &st : uploads_.negotiate(digests)) {
    conn.send_line(wire::format_file_state(st));
  }
}

auto Server::read_fragment(wire::Connection &conn, std::string_view len_token)
    -> std::vector<std::uint8_t> {
  const std::uint64_t len = wire::parse_u64(len_token);
  if (len > cfg_.max_fragment_bytes) {
    throw ProtocolError("fragment of " + std::to_string(len) + " bytes exceeds limit of " +
                        std::to_string(cfg_.max_fragment_bytes));
  }
  std::vector<std::uint8_t> bytes(len);
  if (len != 0) {
    conn.recv_exact(bytes.data(), bytes.size());
  }
  return bytes;
}

void Server::handle_send(wire::Connection &conn, const std::string &peer) {
  auto session = uploads_.open_ingest();
  try {
    for (;;) {
      const auto line = conn.recv_line();
      if (!line) {
        throw wire::ConnectionClosed("stream closed without END");
      }
      const std::string_view sv{*line};
      if (sv == consts::kTokEnd) {
        const SendStatus status = session.finish();
        conn.send_line(std::string(consts::kTokStatus) + std::string(wire::to_string(status)));
        return;
      }
      if (sv.starts_with(consts::kTokFirst)) {
        const auto parts = wire::split(sv.substr(consts::kTokFirst.size()), 3);
        if (parts.size() != 3) {
          throw ProtocolError("malformed FIRST line");
        }
        require_sha256_hex(parts[0]);
        const bool force = wire::parse_flag(parts[1]);
        const auto bytes = read_fragment(conn, parts[2]);
        session.first(parts[0], force, bytes);
      } else if (sv.starts_with(consts::kTokData)) {
        const auto bytes = read_fragment(conn, sv.substr(consts::kTokData.size()));
        session.data(bytes);
      } else {
        throw ProtocolError("unexpected line in data stream: " + one_line(*line));
      }
    }
  } catch (const wire::ConnectionClosed &) {
    if (const auto active = session.active_digest()) {
      log_line(std::cerr, "serve: " + peer + ": stream dropped, " + *active + " left partial");
    }
    session.abandon();
    throw;
  }
}

void Server::handle_assign(wire::Connection &conn, std::string_view args,
                           const std::string &peer) {
  const auto parts = wire::split(args, 3);
  if (parts.size() != 3) {
    throw ProtocolError("malformed ASSIGN header");
  }
  std::optional<std::string> transfer;
  if (parts[0] != consts::kNoTransfer) {
    transfer = std::string(parts[0]);
  }
  const bool force = wire::parse_flag(parts[1]);
  const std::uint64_t n = wire::parse_u64(parts[2]);
  if (n > kMaxDigestsPerRequest) {
    throw ProtocolError("too many digests in one request");
  }

  std::vector<Sha256Filenames> entries;
  entries.reserve(n);
  for (std::uint64_t i = 0; i < n; ++i) {
    const std::string header = conn.expect_line();
    if (!header.starts_with(consts::kTokDigest)) {
      throw ProtocolError("expected DIGEST line");
    }
    const auto dparts = wire::split(std::string_view(header).substr(consts::kTokDigest.size()), 2);
    if (dparts.size() != 2) {
      throw ProtocolError("malformed DIGEST line");
    }
    const std::uint64_t k = wire::parse_u64(dparts[1]);
    if (k > kMaxNamesPerDigest) {
      throw ProtocolError("too many names for one digest");
    }
    Sha256Filenames e{.sha256sum = std::string(dparts[0]), .names = {}};
    e.names.reserve(k);
    for (std::uint64_t j = 0; j < k; ++j) {
      e.names.push_back(conn.expect_line());
    }
    entries.push_back(std::move(e));
  }

  const auto result = namer_.assign_names(transfer, force, entries);
  conn.send_line(std::string(consts::kTokTransfer) + result.transfer);
  std::size_t created = 0;
  for (const auto &st : result.statuses) {
    if (st.status == AssignNameStatus::Success) {
      ++created;
    } else if (st.status == AssignNameStatus::Unspecified) {
      log_line(std::cerr, "serve: " + peer + ": transfer " + result.transfer + ": " +
                              one_line(st.name) + ": " + st.error);
    }
    conn.send_line(std::string(consts::kTokName) + std::string(wire::to_string(st.status)) + " " +
                   st.name);
  }
  conn.send_line(consts::kTokDone);
  log_line(std::cout, "serve: " + peer + ": transfer " + result.transfer + ": " +
                          std::to_string(created) + "/" + std::to_string(result.statuses.size()) +
                          " names bound");
}

} // namespace raptorboost
