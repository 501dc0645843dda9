#pragma once
#include "raptorboost/naming.hpp"
#include "raptorboost/protocol.hpp"
#include "raptorboost/upload.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace raptorboost {

class Client;

// Writer side of one SEND stream. Obtained from Client::send_file_data().
class FileDataSender {
public:
  void first(std::string_view hex, bool force, std::span<const std::uint8_t> bytes);
  void data(std::span<const std::uint8_t> bytes);
  // Closes the stream and returns the status of its last digest.
  SendStatus finish();

private:
  friend class Client;
  explicit FileDataSender(wire::Connection &conn) : conn_{&conn} {}

  wire::Connection *conn_;
};

// Client-side helpers for talking to `raptorboost serve` over TCP.
// Server ERR replies are thrown as wire::RemoteError.
class Client {
public:
  static Client connect(const std::string &host, int port);

  auto get_version() -> std::string;
  auto upload_files(const std::vector<std::string> &digests) -> std::vector<FileState>;
  auto send_file_data() -> FileDataSender;
  auto assign_names(const std::optional<std::string> &transfer, bool force,
                    const std::vector<Sha256Filenames> &entries) -> AssignNamesResult;

private:
  explicit Client(wire::Connection conn) : conn_{std::move(conn)} {}

  wire::Connection conn_;
};

} // namespace raptorboost
