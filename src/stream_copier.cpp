#include "stream_copier.hpp"

#include <cerrno>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace docsync {

FileByteReader::~FileByteReader() {
  if(fd_ >= 0) ::close(fd_);
}

bool FileByteReader::open(const std::filesystem::path& path, std::error_code& ec) {
  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if(fd_ < 0) {
    ec.assign(errno, std::generic_category());
    return false;
  }
  return true;
}

std::size_t FileByteReader::read(char* buffer, std::size_t size, std::error_code& ec) {
  for(;;) {
    auto n = ::read(fd_, buffer, size);
    if(n >= 0) return static_cast<std::size_t>(n);
    if(errno == EINTR) continue;
    ec.assign(errno, std::generic_category());
    return 0;
  }
}

FileByteWriter::~FileByteWriter() {
  if(fd_ >= 0) ::close(fd_);
}

bool FileByteWriter::open(const std::filesystem::path& path, std::error_code& ec) {
  fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if(fd_ < 0) {
    ec.assign(errno, std::generic_category());
    return false;
  }
  return true;
}

std::size_t FileByteWriter::write(const char* buffer, std::size_t size, std::error_code& ec) {
  for(;;) {
    auto n = ::write(fd_, buffer, size);
    if(n >= 0) return static_cast<std::size_t>(n);
    if(errno == EINTR) continue;
    ec.assign(errno, std::generic_category());
    return 0;
  }
}

bool FileByteWriter::close(std::error_code& ec) {
  if(fd_ < 0) return true;
  int rc = ::close(fd_);
  fd_ = -1;
  if(rc != 0) {
    ec.assign(errno, std::generic_category());
    return false;
  }
  return true;
}

StreamCopier::StreamCopier(std::size_t buffer_size)
  : buffer_size_(buffer_size == 0 ? kDefaultBufferSize : buffer_size) {}

SyncError StreamCopier::copy(ByteReader& source, ByteWriter& destination, Stats* stats) const {
  std::vector<char> buffer(buffer_size_);
  Stats local;
  for(;;) {
    std::error_code ec;
    auto got = source.read(buffer.data(), buffer.size(), ec);
    if(ec) return SyncError(sync_errc::read_error, ec.message());
    if(got == 0) break;

    std::size_t written = 0;
    while(written < got) {
      auto n = destination.write(buffer.data() + written, got - written, ec);
      if(ec) return wrap_store_error(ec, "stream write failed");
      if(n == 0) {
        return wrap_store_error("stream write returned 0 bytes (stalled)");
      }
      written += n;
    }
    local.bytes_copied += got;
    ++local.chunks;
  }
  if(stats) *stats = local;
  return {};
}

SyncError StreamCopier::copy_file(const std::filesystem::path& source,
                                  const std::filesystem::path& destination,
                                  Stats* stats) const {
  std::error_code ec;
  if(destination.has_parent_path()) {
    std::filesystem::create_directories(destination.parent_path(), ec);
    if(ec) return wrap_store_error(ec, "cannot create " + destination.parent_path().string());
  }

  FileByteReader reader;
  if(!reader.open(source, ec)) {
    if(ec == std::errc::no_such_file_or_directory) {
      return SyncError(sync_errc::not_found, source.string());
    }
    return SyncError(sync_errc::read_error, "cannot open " + source.string() + ": " + ec.message());
  }
  FileByteWriter writer;
  if(!writer.open(destination, ec)) {
    return wrap_store_error(ec, "cannot open " + destination.string());
  }
  if(auto err = copy(reader, writer, stats)) return err;
  if(!writer.close(ec)) {
    return wrap_store_error(ec, "cannot close " + destination.string());
  }
  return {};
}

} // namespace docsync
