#include "raptorboost/naming.hpp"

#include "raptorboost/consts.hpp"
#include "raptorboost/errors.hpp"
#include "raptorboost/hash.hpp"
#include "raptorboost/time.hpp"

#include <ctime>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace stdfs = std::filesystem;

namespace {

[[nodiscard]] auto random_hex_suffix() -> std::string {
  thread_local std::mt19937 rng{std::random_device{}()};
  std::ostringstream os;
  os << std::hex;
  os.width(8);
  os.fill('0');
  os << static_cast<std::uint32_t>(rng());
  return os.str();
}

} // namespace

namespace raptorboost {

bool is_valid_name(std::string_view name) {
  if (name.empty() || name.front() == '/') {
    return false;
  }
  if (name.find('\0') != std::string_view::npos || name.find('\n') != std::string_view::npos ||
      name.find('\r') != std::string_view::npos) {
    return false;
  }
  std::size_t start = 0;
  while (start <= name.size()) {
    const std::size_t slash = name.find('/', start);
    const std::size_t end = slash == std::string_view::npos ? name.size() : slash;
    const std::string_view part = name.substr(start, end - start);
    if (part.empty() || part == "." || part == "..") {
      return false;
    }
    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }
  return true;
}

bool is_valid_transfer_name(std::string_view name) {
  return is_valid_name(name) && name.find('/') == std::string_view::npos;
}

TransferNamer::TransferNamer(const ContentStore &store) : store_{store} {
  std::error_code ec;
  stdfs::create_directories(transfers_dir(), ec);
  if (ec) {
    throw std::runtime_error("create transfers dir failed: " + ec.message());
  }
}

auto TransferNamer::transfers_dir() const -> stdfs::path {
  return store_.base_dir() / consts::kTransfersDir;
}

auto TransferNamer::transfer_path(std::string_view transfer) const -> stdfs::path {
  if (!is_valid_transfer_name(transfer)) {
    throw InvalidName(std::string(transfer));
  }
  return transfers_dir() / std::string(transfer);
}

AssignNamesResult TransferNamer::assign_names(const std::optional<std::string> &transfer,
                                              bool force,
                                              const std::vector<Sha256Filenames> &entries) const {
  for (const auto &e : entries) {
    require_sha256_hex(e.sha256sum);
    if (store_.query(e.sha256sum).state != ObjectState::Complete) {
      throw PreconditionFailed("digest is not complete: " + e.sha256sum);
    }
    for (const auto &name : e.names) {
      if (!is_valid_name(name)) {
        throw InvalidName(name);
      }
    }
  }

  AssignNamesResult result;
  if (transfer) {
    const auto dir = transfer_path(*transfer);
    std::error_code ec;
    stdfs::create_directories(dir, ec);
    if (ec) {
      throw std::runtime_error("create transfer dir failed: " + dir.string() + ": " + ec.message());
    }
    result.transfer = *transfer;
  } else {
    result.transfer = create_generated_transfer();
  }

  const auto dir = transfer_path(result.transfer);
  for (const auto &e : entries) {
    for (const auto &name : e.names) {
      NameStatus st{.name = name, .status = AssignNameStatus::Unspecified, .error = {}};
      try {
        st.status = bind(dir, name, e.sha256sum, force);
      } catch (const std::runtime_error &err) {
        st.error = err.what();
      }
      result.statuses.push_back(std::move(st));
    }
  }
  return result;
}

auto TransferNamer::lookup(std::string_view transfer, std::string_view name) const
    -> std::optional<std::string> {
  if (!is_valid_name(name)) {
    throw InvalidName(std::string(name));
  }
  const auto link = transfer_path(transfer) / std::string(name);
  std::error_code ec;
  if (!stdfs::is_symlink(stdfs::symlink_status(link, ec))) {
    return std::nullopt;
  }
  const auto target = stdfs::read_symlink(link, ec);
  if (ec) {
    return std::nullopt;
  }
  std::string hex = target.filename().string();
  if (!looks_sha256_hex(hex)) {
    return std::nullopt;
  }
  return hex;
}

auto TransferNamer::create_generated_transfer() const -> std::string {
  const std::string stamp = timeutil::compact_utc_timestamp(std::time(nullptr));
  for (int attempt = 0; attempt < 16; ++attempt) {
    std::string name = std::string(consts::kTransferPrefix) + stamp + "-" + random_hex_suffix();
    std::error_code ec;
    if (stdfs::create_directory(transfers_dir() / name, ec)) {
      return name;
    }
    if (ec) {
      throw std::runtime_error("create transfer dir failed: " + ec.message());
    }
  }
  throw std::runtime_error("could not allocate a unique transfer directory");
}

auto TransferNamer::bind(const stdfs::path &dir, const std::string &name, const std::string &hex,
                         bool force) const -> AssignNameStatus {
  const stdfs::path link = dir / name;
  std::error_code ec;
  stdfs::create_directories(link.parent_path(), ec);
  if (ec) {
    // a parent component is already bound as a file
    if (ec == std::errc::file_exists || ec == std::errc::not_a_directory) {
      return AssignNameStatus::AlreadyExists;
    }
    throw std::runtime_error("create name dir failed: " + link.string() + ": " + ec.message());
  }

  const stdfs::path target = store_.object_path(hex).lexically_relative(link.parent_path());

  stdfs::create_symlink(target, link, ec);
  if (!ec) {
    return AssignNameStatus::Success;
  }
  if (ec != std::errc::file_exists) {
    throw std::runtime_error("create link failed: " + link.string() + ": " + ec.message());
  }
  if (!force || stdfs::is_directory(stdfs::symlink_status(link))) {
    return AssignNameStatus::AlreadyExists;
  }

  stdfs::path tmp = link;
  tmp += ".rb-" + random_hex_suffix();
  stdfs::create_symlink(target, tmp, ec);
  if (ec) {
    throw std::runtime_error("create link failed: " + tmp.string() + ": " + ec.message());
  }
  stdfs::rename(tmp, link, ec);
  if (ec) {
    stdfs::remove(tmp);
    throw std::runtime_error("replace link failed: " + link.string() + ": " + ec.message());
  }
  return AssignNameStatus::Success;
}

} // namespace raptorboost
