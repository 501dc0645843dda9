#pragma once
#include "raptorboost/config.hpp"
#include "raptorboost/fs.hpp"
#include "raptorboost/naming.hpp"
#include "raptorboost/object_store.hpp"
#include "raptorboost/protocol.hpp"
#include "raptorboost/upload.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace raptorboost {

// Version string reported by GetVersion.
auto server_version() -> std::string;

/**
 * TCP front end for the four operations (VERSION, UPLOAD, SEND, ASSIGN).
 * One thread per connection; the store and namer are shared by all of them
 * and must outlive the server.
 */
class Server {
public:
  Server(ServerConfig cfg, ContentStore &store, const TransferNamer &namer);
  ~Server();

  Server(const Server &) = delete;
  auto operator=(const Server &) -> Server & = delete;

  // Binds cfg.host:cfg.port (port 0 picks a free port).
  void listen();
  [[nodiscard]] auto port() const noexcept -> int { return port_; }

  // Accepts until stop() is called. listen() must have succeeded.
  void run();

  // Closes the listener and every client connection, then joins the workers.
  void stop();

private:
  void serve_connection(wire::Connection &conn, const std::string &peer);
  void handle_version(wire::Connection &conn);
  void handle_upload(wire::Connection &conn, std::string_view args);
  void handle_send(wire::Connection &conn, const std::string &peer);
  void handle_assign(wire::Connection &conn, std::string_view args, const std::string &peer);
  auto read_fragment(wire::Connection &conn, std::string_view len_token) -> std::vector<std::uint8_t>;
  void reap_finished();

  ServerConfig cfg_;
  ContentStore &store_;
  const TransferNamer &namer_;
  UploadCoordinator uploads_;

  fs::UniqueFd listen_fd_;
  int port_{0};
  std::atomic<bool> stopping_{false};

  std::mutex mutex_;
  std::uint64_t next_worker_{0};
  std::map<std::uint64_t, std::thread> workers_;
  std::vector<std::uint64_t> finished_;
  std::set<int> client_fds_;
};

} // namespace raptorboost
