#include "raptorboost/errors.hpp"
#include "raptorboost/hash.hpp"
#include "raptorboost/naming.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using raptorboost::AssignNameStatus;

static auto bytes_of(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

static auto store_object(raptorboost::ContentStore &store, std::string_view content) -> std::string {
  const auto hex = raptorboost::to_hex(raptorboost::sha256(content));
  store.append(hex, bytes_of(content), false);
  if (store.finalize(hex) != raptorboost::FinalizeResult::Complete) {
    throw std::runtime_error("could not store test object");
  }
  return hex;
}

static auto slurp(const fs::path &p) -> std::string {
  std::ifstream ifs(p, std::ios::binary);
  return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static int run(const fs::path &tmp) {
  raptorboost::ContentStore store(tmp);
  raptorboost::TransferNamer namer(store);

  const std::string report = "%PDF-1.4 quarterly numbers";
  const std::string notes = "meeting notes";
  const auto report_hex = store_object(store, report);
  const auto notes_hex = store_object(store, notes);
  const auto pending_hex = raptorboost::to_hex(raptorboost::sha256("never uploaded"));

  // Name validation
  for (const char *bad : {"", "/abs", "a//b", "./a", "a/..", "..", "a/", "x\ny"}) {
    if (raptorboost::is_valid_name(bad)) {
      std::cerr << "invalid name accepted: " << bad << "\n";
      return 1;
    }
  }
  for (const char *good : {"report.pdf", "docs/2024/report.pdf", "..hidden", "a.b"}) {
    if (!raptorboost::is_valid_name(good)) {
      std::cerr << "valid name rejected: " << good << "\n";
      return 1;
    }
  }
  if (raptorboost::is_valid_transfer_name("a/b")) {
    std::cerr << "nested transfer name accepted\n";
    return 1;
  }

  // Incomplete digest: nothing is created
  {
    bool threw = false;
    try {
      (void)namer.assign_names(std::string("pending"), false,
                               {{report_hex, {"report.pdf"}}, {pending_hex, {"later.bin"}}});
    } catch (const raptorboost::PreconditionFailed &) {
      threw = true;
    }
    if (!threw || fs::exists(namer.transfers_dir() / "pending")) {
      std::cerr << "precondition failure must leave no transfer dir\n";
      return 1;
    }
  }

  // Invalid name: nothing is created
  {
    bool threw = false;
    try {
      (void)namer.assign_names(std::string("escape"), false, {{report_hex, {"ok.pdf", "../x"}}});
    } catch (const raptorboost::InvalidName &) {
      threw = true;
    }
    if (!threw || fs::exists(namer.transfers_dir() / "escape")) {
      std::cerr << "invalid name must fail the whole call\n";
      return 1;
    }
  }

  // Named transfer, readable through the link
  {
    const auto res = namer.assign_names(std::string("alice-2024"), false, {{report_hex, {"report.pdf"}}});
    if (res.transfer != "alice-2024" || res.statuses.size() != 1 ||
        res.statuses[0].status != AssignNameStatus::Success) {
      std::cerr << "first bind should succeed\n";
      return 1;
    }
    const auto link = namer.transfers_dir() / "alice-2024" / "report.pdf";
    if (!fs::is_symlink(fs::symlink_status(link)) || slurp(link) != report) {
      std::cerr << "report.pdf does not resolve to the stored bytes\n";
      return 1;
    }
    if (fs::read_symlink(link).is_absolute()) {
      std::cerr << "link target should be relative\n";
      return 1;
    }
    if (namer.lookup("alice-2024", "report.pdf") != report_hex) {
      std::cerr << "lookup returned wrong digest\n";
      return 1;
    }
  }

  // Existing name without force keeps its binding
  {
    const auto res = namer.assign_names(std::string("alice-2024"), false, {{notes_hex, {"report.pdf"}}});
    if (res.statuses[0].status != AssignNameStatus::AlreadyExists ||
        namer.lookup("alice-2024", "report.pdf") != report_hex) {
      std::cerr << "binding replaced without force\n";
      return 1;
    }
  }

  // Force rebinds
  {
    const auto res = namer.assign_names(std::string("alice-2024"), true, {{notes_hex, {"report.pdf"}}});
    if (res.statuses[0].status != AssignNameStatus::Success ||
        namer.lookup("alice-2024", "report.pdf") != notes_hex ||
        slurp(namer.transfers_dir() / "alice-2024" / "report.pdf") != notes) {
      std::cerr << "force did not rebind\n";
      return 1;
    }
  }

  // Batch: one collision does not stop the others
  {
    const auto res = namer.assign_names(std::string("alice-2024"), false,
                                        {{report_hex, {"copy-1.pdf", "report.pdf"}},
                                         {notes_hex, {"notes.txt"}}});
    if (res.statuses.size() != 3 || res.statuses[0].name != "copy-1.pdf" ||
        res.statuses[0].status != AssignNameStatus::Success ||
        res.statuses[1].status != AssignNameStatus::AlreadyExists ||
        res.statuses[2].status != AssignNameStatus::Success) {
      std::cerr << "batch statuses wrong\n";
      return 1;
    }
  }

  // Nested names create intermediate dirs; a dir is never replaced by a name
  {
    const auto res = namer.assign_names(std::string("tree"), true,
                                        {{report_hex, {"docs/2024/q1.pdf"}}, {notes_hex, {"docs"}}});
    if (res.statuses[0].status != AssignNameStatus::Success ||
        res.statuses[1].status != AssignNameStatus::AlreadyExists) {
      std::cerr << "nested bind or directory collision wrong\n";
      return 1;
    }
    if (slurp(namer.transfers_dir() / "tree" / "docs" / "2024" / "q1.pdf") != report) {
      std::cerr << "nested link does not resolve\n";
      return 1;
    }
    const auto under_file = namer.assign_names(std::string("tree"), false, {{notes_hex, {"docs/2024/q1.pdf/x"}}});
    if (under_file.statuses[0].status != AssignNameStatus::AlreadyExists) {
      std::cerr << "name under a bound file should collide\n";
      return 1;
    }
  }

  // A name the filesystem refuses does not stop the rest of the batch
  {
    const std::string too_long(300, 'x');
    const auto res = namer.assign_names(std::string("mixed"), false,
                                        {{report_hex, {"a.txt", too_long, "c.txt"}}});
    if (res.statuses.size() != 3 || res.statuses[0].status != AssignNameStatus::Success ||
        res.statuses[1].status != AssignNameStatus::Unspecified || res.statuses[1].error.empty() ||
        res.statuses[2].status != AssignNameStatus::Success) {
      std::cerr << "failed name should be reported without blocking the others\n";
      return 1;
    }
    if (namer.lookup("mixed", "a.txt") != report_hex || namer.lookup("mixed", "c.txt") != report_hex) {
      std::cerr << "names around the failed one were not bound\n";
      return 1;
    }
  }

  // Generated transfer names are unique
  {
    const auto r1 = namer.assign_names(std::nullopt, false, {{report_hex, {"report.pdf"}}});
    const auto r2 = namer.assign_names(std::nullopt, false, {{report_hex, {"report.pdf"}}});
    if (r1.transfer.rfind("transfer-", 0) != 0 || r1.transfer == r2.transfer ||
        !fs::is_directory(namer.transfers_dir() / r1.transfer) ||
        r2.statuses[0].status != AssignNameStatus::Success) {
      std::cerr << "generated transfers wrong: " << r1.transfer << " " << r2.transfer << "\n";
      return 1;
    }
  }

  // Many names share one stored object
  std::size_t objects = 0;
  for (const auto &e : fs::recursive_directory_iterator(store.complete_dir())) {
    if (e.is_regular_file()) {
      ++objects;
    }
  }
  if (objects != 2) {
    std::cerr << "expected 2 stored objects, found " << objects << "\n";
    return 1;
  }
  return 0;
}

int main() {
  const fs::path tmp =
      fs::temp_directory_path() / ("raptorboost_naming_test_" + std::to_string(std::random_device{}()));
  int rc = 0;
  try {
    rc = run(tmp);
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }
  std::error_code ec;
  fs::remove_all(tmp, ec);
  if (rc == 0) {
    std::cout << "naming test OK\n";
  }
  return rc;
}
