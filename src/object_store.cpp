#include "raptorboost/object_store.hpp"

#include "raptorboost/consts.hpp"
#include "raptorboost/errors.hpp"
#include "raptorboost/hash.hpp"

#include <stdexcept>
#include <system_error>

namespace stdfs = std::filesystem;

namespace raptorboost {

std::uint64_t ObjectWriter::append(std::span<const std::uint8_t> bytes) {
  if (!fd_) {
    throw std::logic_error("object_store: append on a finished writer");
  }
  fs::write_all(fd_.get(), bytes);
  offset_ += bytes.size();
  return offset_;
}

FinalizeResult ObjectWriter::finalize() {
  if (!fd_) {
    throw std::logic_error("object_store: finalize on a finished writer");
  }
  fs::sync(fd_.get(), store_->partial_path(hex()));
  fd_.reset();
  const auto result = store_->promote(hex());
  lease_.release();
  return result;
}

ContentStore::ContentStore(stdfs::path base_dir) : base_dir_(stdfs::absolute(base_dir)) {
  std::error_code ec;
  stdfs::create_directories(complete_dir(), ec);
  if (ec) {
    throw std::runtime_error("create complete dir failed: " + ec.message());
  }
  stdfs::create_directories(partial_dir(), ec);
  if (ec) {
    throw std::runtime_error("create partial dir failed: " + ec.message());
  }
}

auto ContentStore::complete_dir() const -> stdfs::path { return base_dir_ / consts::kCompleteDir; }

auto ContentStore::partial_dir() const -> stdfs::path { return base_dir_ / consts::kPartialDir; }

auto ContentStore::object_path(std::string_view hex) const -> stdfs::path {
  require_sha256_hex(hex);
  const std::string h(hex);
  return complete_dir() / h.substr(0, consts::kFanoutDirHexLen) / h;
}

auto ContentStore::partial_path(std::string_view hex) const -> stdfs::path {
  require_sha256_hex(hex);
  return partial_dir() / std::string(hex);
}

ObjectStatus ContentStore::query(std::string_view hex) const {
  const auto complete = object_path(hex);
  if (fs::exists(complete)) {
    return ObjectStatus{.state = ObjectState::Complete, .offset = fs::file_size(complete)};
  }
  const auto partial = partial_path(hex);
  if (fs::exists(partial)) {
    return ObjectStatus{.state = ObjectState::Partial, .offset = fs::file_size(partial)};
  }
  return ObjectStatus{};
}

std::optional<ObjectWriter> ContentStore::open_writer(std::string_view hex, bool force_restart) {
  require_sha256_hex(hex);
  auto lease = locks_.try_acquire(hex);
  if (!lease) {
    throw WriteConflict(std::string(hex));
  }

  // checked under the lease so a concurrent finalize cannot slip in between
  const auto status = query(hex);
  if (status.state == ObjectState::Complete && !force_restart) {
    // staged bytes of an abandoned forced restage
    discard_partial(hex);
    return std::nullopt;
  }

  const bool restart = force_restart || status.state != ObjectState::Partial;
  auto fd = fs::open_append(partial_path(hex), restart);
  const std::uint64_t offset = restart ? 0 : status.offset;
  return ObjectWriter{*this, std::move(*lease), std::move(fd), offset};
}

std::uint64_t ContentStore::append(std::string_view hex, std::span<const std::uint8_t> bytes,
                                   bool force_restart) {
  auto writer = open_writer(hex, force_restart);
  if (!writer) {
    return fs::file_size(object_path(hex));
  }
  return writer->append(bytes);
}

FinalizeResult ContentStore::finalize(std::string_view hex) {
  require_sha256_hex(hex);
  auto lease = locks_.try_acquire(hex);
  if (!lease) {
    throw WriteConflict(std::string(hex));
  }
  const auto status = query(hex);
  if (status.state == ObjectState::Complete) {
    // staged bytes here belong to an abandoned forced restage; the stored
    // object already holds the content for this digest
    discard_partial(hex);
    return FinalizeResult::Complete;
  }
  if (status.state == ObjectState::Missing) {
    // nothing staged: verify the empty content
    auto fd = fs::open_append(partial_path(hex), true);
    fs::sync(fd.get(), partial_path(hex));
  }
  return promote(std::string(hex));
}

void ContentStore::discard_partial(std::string_view hex) const {
  const auto partial = partial_path(hex);
  std::error_code ec;
  stdfs::remove(partial, ec);
  if (ec) {
    throw std::runtime_error("discard staged object failed: " + partial.string() + ": " +
                             ec.message());
  }
}

FinalizeResult ContentStore::promote(const std::string &hex) const {
  const auto partial = partial_path(hex);
  if (to_hex(sha256_file(partial)) != hex) {
    discard_partial(hex);
    return FinalizeResult::ChecksumMismatch;
  }

  std::error_code ec;

  const auto complete = object_path(hex);
  fs::ensure_parent_dir(complete);
  stdfs::rename(partial, complete, ec);
  if (ec) {
    throw std::runtime_error("promote object failed: " + complete.string() + ": " + ec.message());
  }
  return FinalizeResult::Complete;
}

bool ContentStore::verify(std::string_view hex) const {
  const auto complete = object_path(hex);
  if (!fs::exists(complete)) {
    return false;
  }
  return to_hex(sha256_file(complete)) == hex;
}

} // namespace raptorboost
