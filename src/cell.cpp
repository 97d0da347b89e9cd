#include "lazycsv/cell.h"

#include "lazycsv/boundary_scanner.h"
#include "lazycsv/utf8.h"

namespace lazycsv {

namespace {

constexpr uint8_t QUOTE = static_cast<uint8_t>(QUOTE_CHAR);

const char* decode_error_message(ErrorCode code) {
  switch (code) {
  case ErrorCode::INVALID_UTF8:
    return "Cell is not valid UTF-8";
  case ErrorCode::ALLOCATION_DISABLED:
    return "Cell contains escaped quotes and allocation is not permitted";
  default:
    return error_code_to_string(code);
  }
}

} // namespace

ParseError make_decode_error(ErrorCode code, size_t byte_offset) {
  return ParseError(code, ErrorSeverity::ERROR, 0, 0, byte_offset, decode_error_message(code));
}

void throw_decode_error(ErrorCode code, size_t byte_offset) {
  throw ParseException(make_decode_error(code, byte_offset));
}

size_t Cell::escaped_quote_count() const {
  if (!quoted_) {
    return 0;
  }

  size_t pairs = 0;
  size_t pos = 0;
  while (auto q = find_next_of(data_, size_, pos, QUOTE)) {
    if (*q + 1 < size_ && data_[*q + 1] == QUOTE) {
      ++pairs;
      pos = *q + 2;
    } else {
      pos = *q + 1;
    }
  }
  return pairs;
}

DecodeResult<std::string_view> Cell::try_as_borrowed_str() const {
  size_t bad = utf8_validate(data_, size_);
  if (bad != size_) {
    return DecodeResult<std::string_view>::failure(ErrorCode::INVALID_UTF8, offset_ + bad);
  }

  if (quoted_ && escaped_quote_count() != 0) {
    return DecodeResult<std::string_view>::failure(ErrorCode::ALLOCATION_DISABLED, offset_);
  }
  return DecodeResult<std::string_view>::success(raw());
}

DecodeResult<CellText> Cell::try_as_str(Allocation alloc) const {
  const size_t pairs = escaped_quote_count();

  // Collapsing "" to " never joins or splits a multi-byte sequence, so the
  // raw extent is valid exactly when the unescaped text is.
  size_t bad = utf8_validate(data_, size_);
  if (bad != size_) {
    return DecodeResult<CellText>::failure(ErrorCode::INVALID_UTF8, offset_ + bad);
  }

  if (pairs == 0) {
    return DecodeResult<CellText>::success(CellText::borrowed(raw()));
  }

#ifdef LAZYCSV_NO_ALLOC
  (void)alloc;
  return DecodeResult<CellText>::failure(ErrorCode::ALLOCATION_DISABLED, offset_);
#else
  if (alloc == Allocation::FORBIDDEN) {
    return DecodeResult<CellText>::failure(ErrorCode::ALLOCATION_DISABLED, offset_);
  }

  std::string out;
  out.reserve(size_ - pairs);

  const char* chars = reinterpret_cast<const char*>(data_);
  size_t pos = 0;
  while (auto q = find_next_of(data_, size_, pos, QUOTE)) {
    // Copy through the first quote of the pair, skip the second
    out.append(chars + pos, *q + 1 - pos);
    pos = *q + 1;
    if (pos < size_ && data_[pos] == QUOTE) {
      ++pos;
    }
  }
  out.append(chars + pos, size_ - pos);

  return DecodeResult<CellText>::success(CellText::owned(std::move(out)));
#endif
}

} // namespace lazycsv
