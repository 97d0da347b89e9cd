/**
 * @file io_util.h
 * @brief Load a whole file or stdin into an owned, 64-byte aligned buffer.
 *
 * The scanner never reads past the end of its input, so no padding is
 * allocated. The buffer only needs to outlive the Csv objects reading it.
 *
 * @code
 * lazycsv::FileBuffer buffer = lazycsv::load_file("data.csv");
 * lazycsv::Csv csv(buffer.data(), buffer.size());
 * @endcode
 */

#ifndef LAZYCSV_IO_UTIL_H
#define LAZYCSV_IO_UTIL_H

#include "lazycsv/error.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace lazycsv {

/**
 * @brief Owns an aligned byte buffer; frees it with aligned_free().
 *
 * Move-only. A default-constructed FileBuffer is invalid; a FileBuffer
 * loaded from an empty file is valid and empty.
 */
class FileBuffer {
public:
  FileBuffer() : data_(nullptr), size_(0) {}

  /// Takes ownership of data, which must come from aligned_malloc().
  FileBuffer(uint8_t* data, size_t size) : data_(data), size_(size) {}

  FileBuffer(FileBuffer&& other) noexcept : data_(other.data_), size_(other.size_) {
    other.data_ = nullptr;
    other.size_ = 0;
  }

  FileBuffer& operator=(FileBuffer&& other) noexcept {
    if (this != &other) {
      free();
      data_ = other.data_;
      size_ = other.size_;
      other.data_ = nullptr;
      other.size_ = 0;
    }
    return *this;
  }

  FileBuffer(const FileBuffer&) = delete;
  FileBuffer& operator=(const FileBuffer&) = delete;

  ~FileBuffer() { free(); }

  const uint8_t* data() const { return data_; }
  uint8_t* data() { return data_; }
  size_t size() const { return size_; }
  bool valid() const { return data_ != nullptr; }
  bool empty() const { return size_ == 0; }
  explicit operator bool() const { return valid(); }

  std::string_view view() const {
    return std::string_view(reinterpret_cast<const char*>(data_), size_);
  }

  /// Give up ownership; the caller must aligned_free() the result.
  uint8_t* release() {
    uint8_t* p = data_;
    data_ = nullptr;
    size_ = 0;
    return p;
  }

private:
  void free();

  uint8_t* data_;
  size_t size_;
};

/// Aligned (64-byte) allocation of length bytes. Returns nullptr on failure.
uint8_t* allocate_aligned_buffer(size_t length);

/// Copy bytes into a new FileBuffer.
/// @throws ParseException with IO_ERROR if allocation fails.
FileBuffer copy_to_buffer(const uint8_t* data, size_t length);

/**
 * @brief Read the whole file at filename.
 * @throws ParseException with IO_ERROR if the file cannot be opened or read.
 */
FileBuffer load_file(const std::string& filename);

/**
 * @brief Read stream until EOF. An empty stream gives an empty buffer.
 * @throws ParseException with IO_ERROR if reading fails.
 */
FileBuffer load_stream(std::FILE* stream);

/// load_stream(stdin).
FileBuffer load_stdin();

} // namespace lazycsv

#endif // LAZYCSV_IO_UTIL_H
