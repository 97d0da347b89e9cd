#include "lazycsv/io_util.h"

#include "lazycsv/common_defs.h"
#include "lazycsv/mem_util.h"

#include <cerrno>
#include <cstring>
#include <vector>

namespace lazycsv {

namespace {

[[noreturn]] void throw_io_error(const std::string& message) {
  throw ParseException(ParseError(ErrorCode::IO_ERROR, ErrorSeverity::FATAL, 0, 0, 0, message));
}

std::string describe_errno(const std::string& what) {
  if (errno == 0) return what;
  return what + ": " + std::strerror(errno);
}

} // namespace

void FileBuffer::free() {
  aligned_free(data_);
  data_ = nullptr;
  size_ = 0;
}

uint8_t* allocate_aligned_buffer(size_t length) {
  return static_cast<uint8_t*>(aligned_malloc(LAZYCSV_BLOCK_SIZE, length));
}

FileBuffer copy_to_buffer(const uint8_t* data, size_t length) {
  uint8_t* buf = allocate_aligned_buffer(length);
  if (buf == nullptr) {
    throw_io_error("could not allocate " + std::to_string(length) + " bytes");
  }
  if (length > 0) std::memcpy(buf, data, length);
  return FileBuffer(buf, length);
}

FileBuffer load_file(const std::string& filename) {
  errno = 0;
  std::FILE* fp = std::fopen(filename.c_str(), "rb");
  if (fp == nullptr) {
    throw_io_error(describe_errno("could not open '" + filename + "'"));
  }

  long end = std::fseek(fp, 0, SEEK_END) == 0 ? std::ftell(fp) : -1;
  if (end < 0) {
    // Not seekable (a pipe or a character device): nothing has been consumed yet
    std::clearerr(fp);
    try {
      FileBuffer buffer = load_stream(fp);
      std::fclose(fp);
      return buffer;
    } catch (const ParseException&) {
      std::fclose(fp);
      throw;
    }
  }

  const size_t len = static_cast<size_t>(end);
  FileBuffer buffer(allocate_aligned_buffer(len), len);
  if (!buffer) {
    std::fclose(fp);
    throw_io_error("could not allocate " + std::to_string(len) + " bytes");
  }

  std::rewind(fp);
  size_t readb = len == 0 ? 0 : std::fread(buffer.data(), 1, len, fp);
  std::fclose(fp);
  if (readb != len) {
    throw_io_error("could not read '" + filename + "'");
  }
  return buffer;
}

FileBuffer load_stream(std::FILE* stream) {
  const size_t chunk_size = 64 * 1024;
  std::vector<uint8_t> data;
  std::vector<uint8_t> chunk(chunk_size);

  while (true) {
    size_t bytes_read = std::fread(chunk.data(), 1, chunk_size, stream);
    if (bytes_read > 0) {
      data.insert(data.end(), chunk.begin(), chunk.begin() + bytes_read);
    }
    if (bytes_read < chunk_size) {
      if (std::ferror(stream)) {
        throw_io_error("could not read from stream");
      }
      break;
    }
  }

  return copy_to_buffer(data.data(), data.size());
}

FileBuffer load_stdin() {
  return load_stream(stdin);
}

} // namespace lazycsv
