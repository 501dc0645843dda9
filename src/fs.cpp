#include "raptorboost/fs.hpp"

#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace raptorboost::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    throw std::runtime_error("atomic replace failed: " + p.string());
  }
}

std::uint64_t file_size(const std::filesystem::path &p) {
  std::error_code ec;
  const auto n = std::filesystem::file_size(p, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory)
      return 0;
    throw std::runtime_error("stat failed: " + p.string() + ": " + ec.message());
  }
  return n;
}

void UniqueFd::close_if_open() noexcept {
  if (fd_ != -1) {
    // best effort; no throw in destructor
    ::close(fd_);
    fd_ = -1;
  }
}

UniqueFd open_append(const std::filesystem::path &p, bool truncate) {
  ensure_parent_dir(p);
  int flags = O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC;
  if (truncate)
    flags |= O_TRUNC;
  const int fd = ::open(p.c_str(), flags, 0644);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(), "open " + p.string());
  }
  return UniqueFd{fd};
}

void write_all(int fd, std::span<const std::uint8_t> data) {
  const std::uint8_t *p = data.data();
  std::size_t n = data.size();
  while (n != 0U) {
    const ssize_t w = ::write(fd, p, n);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "write");
    }
    p += static_cast<std::size_t>(w);
    n -= static_cast<std::size_t>(w);
  }
}

void sync(int fd, const std::filesystem::path &p) {
  if (::fsync(fd) != 0) {
    throw std::system_error(errno, std::generic_category(), "fsync " + p.string());
  }
}

} // namespace raptorboost::fs
