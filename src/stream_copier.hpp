#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

#include "sync_error.hpp"

namespace docsync {

class ByteReader {
public:
  virtual ~ByteReader() = default;
  // Bytes read, 0 at end of input. Failures are reported through ec.
  virtual std::size_t read(char* buffer, std::size_t size, std::error_code& ec) = 0;
};

class ByteWriter {
public:
  virtual ~ByteWriter() = default;
  // Bytes accepted; may be fewer than size. Failures are reported through ec.
  virtual std::size_t write(const char* buffer, std::size_t size, std::error_code& ec) = 0;
};

class FileByteReader : public ByteReader {
public:
  FileByteReader() = default;
  ~FileByteReader() override;
  FileByteReader(const FileByteReader&) = delete;
  FileByteReader& operator=(const FileByteReader&) = delete;

  bool open(const std::filesystem::path& path, std::error_code& ec);
  std::size_t read(char* buffer, std::size_t size, std::error_code& ec) override;

private:
  int fd_ = -1;
};

class FileByteWriter : public ByteWriter {
public:
  FileByteWriter() = default;
  ~FileByteWriter() override;
  FileByteWriter(const FileByteWriter&) = delete;
  FileByteWriter& operator=(const FileByteWriter&) = delete;

  // Truncates or creates the file.
  bool open(const std::filesystem::path& path, std::error_code& ec);
  std::size_t write(const char* buffer, std::size_t size, std::error_code& ec) override;
  bool close(std::error_code& ec);

private:
  int fd_ = -1;
};

class StreamCopier {
public:
  static constexpr std::size_t kDefaultBufferSize = 64 * 1024;

  struct Stats {
    uint64_t bytes_copied = 0;
    std::size_t chunks = 0;
  };

  explicit StreamCopier(std::size_t buffer_size = kDefaultBufferSize);

  std::size_t buffer_size() const { return buffer_size_; }

  // Read errors become read_error, write errors and zero-byte writes become
  // store_error. A zero-byte write is never retried.
  SyncError copy(ByteReader& source, ByteWriter& destination, Stats* stats = nullptr) const;

  // Creates the destination's parent directories before the first write.
  SyncError copy_file(const std::filesystem::path& source,
                      const std::filesystem::path& destination,
                      Stats* stats = nullptr) const;

private:
  std::size_t buffer_size_;
};

} // namespace docsync
