#include "raptorboost/client.hpp"
#include "raptorboost/hash.hpp"
#include "raptorboost/server.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using raptorboost::AssignNameStatus;
using raptorboost::FileStateResult;
using raptorboost::SendStatus;
using raptorboost::wire::ErrorKind;
using raptorboost::wire::RemoteError;

static auto bytes_of(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

static auto hex_of(std::string_view s) -> std::string {
  return raptorboost::to_hex(raptorboost::sha256(s));
}

static auto slurp(const fs::path &p) -> std::string {
  std::ifstream ifs(p, std::ios::binary);
  return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static bool wait_for(const std::function<bool()> &cond) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (std::chrono::steady_clock::now() < deadline) {
    if (cond()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return cond();
}

static int run(raptorboost::ContentStore &store, const raptorboost::TransferNamer &namer, int port) {
  const std::string host = "127.0.0.1";

  // Version and the basic upload-then-name flow
  {
    auto client = raptorboost::Client::connect(host, port);
    if (client.get_version() != raptorboost::server_version()) {
      std::cerr << "version mismatch\n";
      return 1;
    }

    const std::string report = "%PDF-1.7 " + std::string(300000, 'r');
    const auto hex = hex_of(report);
    const auto states = client.upload_files({hex});
    if (states.size() != 1 || states[0].sha256sum != hex ||
        states[0].state != FileStateResult::NeedMoreData || states[0].offset != 0u) {
      std::cerr << "new digest should need data from 0\n";
      return 1;
    }

    auto sender = client.send_file_data();
    const std::string_view view = report;
    sender.first(hex, false, bytes_of(view.substr(0, 100000)));
    sender.data(bytes_of(view.substr(100000, 100000)));
    sender.data(bytes_of(view.substr(200000)));
    if (sender.finish() != SendStatus::Complete) {
      std::cerr << "upload over the wire did not complete\n";
      return 1;
    }
    if (client.upload_files({hex})[0].state != FileStateResult::Complete) {
      std::cerr << "uploaded digest not reported complete\n";
      return 1;
    }

    const auto res = client.assign_names(std::string("alice-2024"), false, {{hex, {"report.pdf"}}});
    if (res.transfer != "alice-2024" || res.statuses.size() != 1 ||
        res.statuses[0].name != "report.pdf" || res.statuses[0].status != AssignNameStatus::Success) {
      std::cerr << "assign over the wire failed\n";
      return 1;
    }
    if (slurp(namer.transfers_dir() / "alice-2024" / "report.pdf") != report) {
      std::cerr << "named file content differs\n";
      return 1;
    }

    const auto again = client.assign_names(std::string("alice-2024"), false, {{hex, {"report.pdf"}}});
    if (again.statuses[0].status != AssignNameStatus::AlreadyExists) {
      std::cerr << "second assign should report ALREADY_EXISTS\n";
      return 1;
    }

    const auto generated = client.assign_names(std::nullopt, false, {{hex, {"a b.pdf"}}});
    if (generated.transfer.rfind("transfer-", 0) != 0 ||
        generated.statuses[0].name != "a b.pdf") {
      std::cerr << "generated transfer or spaced name wrong\n";
      return 1;
    }
  }

  // Dropped stream resumes from the staged offset
  {
    const std::string big = std::string(50000, 'x') + std::string(50000, 'y');
    const auto hex = hex_of(big);
    {
      auto client = raptorboost::Client::connect(host, port);
      auto sender = client.send_file_data();
      sender.first(hex, false, bytes_of(std::string_view(big).substr(0, 30000)));
    }
    const bool staged = wait_for([&] {
      const auto st = store.query(hex);
      return st.state == raptorboost::ObjectState::Partial && st.offset == 30000 &&
             !store.locks().is_held(hex);
    });
    if (!staged) {
      std::cerr << "dropped stream did not leave a 30000-byte partial\n";
      return 1;
    }

    auto client = raptorboost::Client::connect(host, port);
    const auto st = client.upload_files({hex});
    if (st[0].state != FileStateResult::NeedMoreData || st[0].offset != 30000u) {
      std::cerr << "negotiate should report offset 30000\n";
      return 1;
    }
    auto sender = client.send_file_data();
    sender.first(hex, false, bytes_of(std::string_view(big).substr(30000)));
    if (sender.finish() != SendStatus::Complete) {
      std::cerr << "resumed upload did not complete\n";
      return 1;
    }
  }

  // DATA without FIRST is a protocol error
  {
    auto client = raptorboost::Client::connect(host, port);
    auto sender = client.send_file_data();
    sender.data(bytes_of("orphan"));
    bool protocol = false;
    try {
      (void)sender.finish();
    } catch (const RemoteError &e) {
      protocol = e.kind() == ErrorKind::Protocol && !e.retryable();
    }
    if (!protocol) {
      std::cerr << "expected ERR PROTOCOL\n";
      return 1;
    }
  }

  // A second writer for an in-flight digest gets a retryable conflict
  {
    const std::string body = "contended object body";
    const auto hex = hex_of(body);
    auto holder = raptorboost::Client::connect(host, port);
    auto held = holder.send_file_data();
    held.first(hex, false, bytes_of(std::string_view(body).substr(0, 9)));
    if (!wait_for([&] { return store.locks().is_held(hex); })) {
      std::cerr << "first writer never took the lease\n";
      return 1;
    }

    {
      auto other = raptorboost::Client::connect(host, port);
      auto sender = other.send_file_data();
      sender.first(hex, false, bytes_of(body));
      bool conflict = false;
      try {
        (void)sender.finish();
      } catch (const RemoteError &e) {
        conflict = e.kind() == ErrorKind::Conflict && e.retryable();
      }
      if (!conflict) {
        std::cerr << "expected ERR CONFLICT\n";
        return 1;
      }
    }

    held.data(bytes_of(std::string_view(body).substr(9)));
    if (held.finish() != SendStatus::Complete) {
      std::cerr << "lease holder should complete after the conflict\n";
      return 1;
    }
  }

  // Naming an incomplete digest fails, and the connection stays usable
  {
    auto client = raptorboost::Client::connect(host, port);
    bool precondition = false;
    try {
      (void)client.assign_names(std::string("early"), false, {{hex_of("not stored"), {"x"}}});
    } catch (const RemoteError &e) {
      precondition = e.kind() == ErrorKind::Precondition;
    }
    if (!precondition || fs::exists(namer.transfers_dir() / "early")) {
      std::cerr << "expected ERR PRECONDITION without side effects\n";
      return 1;
    }
    bool invalid = false;
    try {
      (void)client.upload_files({"ABC"});
    } catch (const RemoteError &e) {
      invalid = e.kind() == ErrorKind::Invalid;
    }
    if (!invalid) {
      std::cerr << "expected ERR INVALID for a malformed digest\n";
      return 1;
    }
    if (client.get_version() != raptorboost::server_version()) {
      std::cerr << "connection unusable after a request error\n";
      return 1;
    }
  }

  // Concurrent clients on distinct digests
  {
    constexpr int kClients = 6;
    std::vector<int> ok(kClients, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i < kClients; ++i) {
      threads.emplace_back([&, i] {
        try {
          const std::string body = "client " + std::to_string(i) + std::string(20000 + i, 'c');
          const auto hex = hex_of(body);
          auto client = raptorboost::Client::connect(host, port);
          (void)client.upload_files({hex});
          auto sender = client.send_file_data();
          sender.first(hex, false, bytes_of(body));
          if (sender.finish() != SendStatus::Complete) {
            return;
          }
          const auto res = client.assign_names(std::string("shared"), false,
                                               {{hex, {"file-" + std::to_string(i)}}});
          ok[i] = res.statuses[0].status == AssignNameStatus::Success ? 1 : 0;
        } catch (const std::exception &e) {
          std::cerr << "client " << i << ": " << e.what() << "\n";
        }
      });
    }
    for (auto &t : threads) {
      t.join();
    }
    for (int i = 0; i < kClients; ++i) {
      if (ok[i] != 1) {
        std::cerr << "concurrent client " << i << " failed\n";
        return 1;
      }
    }
  }
  return 0;
}

int main() {
  const fs::path tmp =
      fs::temp_directory_path() / ("raptorboost_server_test_" + std::to_string(std::random_device{}()));
  int rc = 0;
  try {
    raptorboost::ContentStore store(tmp);
    raptorboost::TransferNamer namer(store);
    raptorboost::ServerConfig cfg;
    cfg.base_dir = tmp;
    cfg.host = "127.0.0.1";
    cfg.port = 0;

    raptorboost::Server server(cfg, store, namer);
    server.listen();
    std::thread loop([&server] {
      try {
        server.run();
      } catch (const std::exception &e) {
        std::cerr << "server loop: " << e.what() << "\n";
      }
    });

    try {
      rc = run(store, namer, server.port());
    } catch (const std::exception &e) {
      std::cerr << "exception: " << e.what() << "\n";
      rc = 1;
    }
    server.stop();
    loop.join();
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }
  std::error_code ec;
  fs::remove_all(tmp, ec);
  if (rc == 0) {
    std::cout << "server test OK\n";
  }
  return rc;
}
