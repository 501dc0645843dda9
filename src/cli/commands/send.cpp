#include "cli/registry.hpp"
#include "raptorboost/client.hpp"
#include "raptorboost/consts.hpp"
#include "raptorboost/hash.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Streams the tail of `path` starting at `offset` as one object of the stream.
static void send_tail(raptorboost::FileDataSender &sender, const std::string &hex,
                      const fs::path &path, std::uint64_t offset, bool restart) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + path.string());
  }
  ifs.seekg(static_cast<std::streamoff>(offset));
  std::vector<std::uint8_t> buf(raptorboost::consts::kClientChunkBytes);
  bool first = true;
  while (true) {
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
    const auto n = static_cast<std::size_t>(ifs.gcount());
    const std::span<const std::uint8_t> chunk(buf.data(), n);
    if (first) {
      sender.first(hex, restart, chunk);
      first = false;
    } else if (n != 0) {
      sender.data(chunk);
    }
    if (n < buf.size()) {
      break;
    }
  }
  if (ifs.bad()) {
    throw std::runtime_error("read failed: " + path.string());
  }
}

int cmd_send(int argc, char **argv) {
  if (argc < 3) {
    std::cerr << "usage: raptorboost send <host[:port]> [--name transfer] [--force] [--restart] "
                 "<file>...\n";
    return 2;
  }
  std::optional<std::string> transfer;
  bool force_names = false;
  bool restart = false;
  std::vector<fs::path> files;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--name" && i + 1 < argc) {
      transfer = argv[++i];
    } else if (arg == "--force") {
      force_names = true;
    } else if (arg == "--restart") {
      restart = true;
    } else {
      files.emplace_back(arg);
    }
  }

  if (files.empty()) {
    std::cerr << "send: no files given\n";
    return 2;
  }

  try {
    // digest -> (file, names)
    std::map<std::string, std::pair<fs::path, std::vector<std::string>>> by_digest;
    for (const auto &f : files) {
      const std::string hex = raptorboost::to_hex(raptorboost::sha256_file(f));
      auto &slot = by_digest[hex];
      slot.first = f;
      slot.second.push_back(f.filename().string());
    }
    std::vector<std::string> digests;
    for (const auto &[hex, v] : by_digest) {
      digests.push_back(hex);
    }

    const auto ep = raptorboost::cli::parse_endpoint(argv[1]);
    auto client = raptorboost::Client::connect(ep.host, ep.port);

    const auto states = client.upload_files(digests);
    std::optional<raptorboost::FileDataSender> sender;
    for (const auto &st : states) {
      if (st.state == raptorboost::FileStateResult::Complete && !restart) {
        continue;
      }
      if (!sender) {
        sender = client.send_file_data();
      }
      const auto &path = by_digest.at(st.sha256sum).first;
      std::uint64_t offset = restart ? 0 : st.offset.value_or(0);
      const bool fresh = restart || offset > fs::file_size(path);
      if (fresh) {
        offset = 0;
      }
      send_tail(*sender, st.sha256sum, path, offset, fresh);
    }
    if (sender && sender->finish() == raptorboost::SendStatus::ErrorChecksum) {
      std::cerr << "send: checksum mismatch reported by server\n";
    }

    // the stream only reports its last digest; ask again for all of them
    for (const auto &st : client.upload_files(digests)) {
      if (st.state != raptorboost::FileStateResult::Complete) {
        std::cerr << "send: upload incomplete for " << by_digest.at(st.sha256sum).first << "\n";
        return 1;
      }
    }

    std::vector<raptorboost::Sha256Filenames> entries;
    for (const auto &[hex, v] : by_digest) {
      entries.push_back(raptorboost::Sha256Filenames{.sha256sum = hex, .names = v.second});
    }
    const auto result = client.assign_names(transfer, force_names, entries);
    int rc = 0;
    for (const auto &ns : result.statuses) {
      if (ns.status == raptorboost::AssignNameStatus::AlreadyExists) {
        std::cerr << "send: " << ns.name << " already exists in " << result.transfer << "\n";
        rc = 1;
      } else if (ns.status != raptorboost::AssignNameStatus::Success) {
        std::cerr << "send: " << ns.name << " could not be bound in " << result.transfer << "\n";
        rc = 1;
      }
    }
    std::cout << "Sent " << files.size() << " file(s) to transfer '" << result.transfer << "'\n";
    return rc;
  } catch (const std::exception &e) {
    std::cerr << "send: " << e.what() << "\n";
    return 1;
  }
}
