#include "lazycsv/csv.h"

#include "lazycsv/boundary_scanner.h"
#include "lazycsv/cell_recognizer.h"
#include "lazycsv/common_defs.h"

#include <cstdio>
#include <stdexcept>

namespace lazycsv {

namespace {

constexpr size_t CONTEXT_BYTES = 16;

const char* syntax_error_message(ErrorCode code) {
  switch (code) {
  case ErrorCode::UNCLOSED_QUOTE:
    return "Quoted cell is not closed before end of buffer";
  case ErrorCode::INVALID_QUOTE_ESCAPE:
    return "Closing quote must be followed by a delimiter, a newline or end of buffer";
  case ErrorCode::QUOTE_IN_UNQUOTED_FIELD:
    return "Quote inside an unquoted cell; quotes may only start a cell";
  case ErrorCode::INVALID_LINE_ENDING:
    return "Carriage return not followed by line feed";
  default:
    return error_code_to_string(code);
  }
}

// Printable snippet of the bytes around offset, with control bytes escaped.
std::string make_context(const uint8_t* buf, size_t len, size_t offset) {
  const size_t begin = offset > CONTEXT_BYTES ? offset - CONTEXT_BYTES : 0;
  const size_t end = (len - offset) > CONTEXT_BYTES ? offset + CONTEXT_BYTES : len;

  std::string ctx;
  for (size_t i = begin; i < end; ++i) {
    const uint8_t c = buf[i];
    if (c == '\n') {
      ctx += "\\n";
    } else if (c == '\r') {
      ctx += "\\r";
    } else if (c == '\t') {
      ctx += "\\t";
    } else if (c < 32 || c == 127) {
      char hex[8];
      std::snprintf(hex, sizeof(hex), "\\x%02x", c);
      ctx += hex;
    } else {
      ctx += static_cast<char>(c);
    }
  }
  return ctx;
}

} // namespace

Csv::Csv(const uint8_t* buf, size_t len, const Dialect& dialect)
    : buf_(buf), len_(len), dialect_(dialect), state_(len == 0 ? State::DONE : State::CELL) {
  if (!dialect_.is_valid()) {
    throw std::invalid_argument("Invalid delimiter for CSV dialect: " + dialect_.to_string());
  }
}

bool Csv::next(CsvItem& item) {
  switch (state_) {
  case State::CELL: {
    CellScan scan = recognize_cell(buf_, len_, cursor_, dialect_);
    if (unlikely(!scan.ok())) {
      fail(scan);
      return false;
    }
    item = CsvItem::make_cell(scan.cell);
    ++column_;
    cursor_ = scan.next;
    if (scan.terminator != Terminator::SEPARATOR) {
      // Newline or end of buffer: the row is closed by the next call
      state_ = State::ROW_END;
    }
    return true;
  }
  case State::ROW_END:
    item = CsvItem::row_end();
    ++line_;
    column_ = 0;
    state_ = cursor_ >= len_ ? State::DONE : State::CELL;
    return true;
  case State::DONE:
  case State::FAILED:
    return false;
  }
  return false;
}

bool Csv::next(CsvItem& item, ErrorCollector& errors) {
  const bool was_failed = failed();
  if (next(item)) return true;
  if (failed() && !was_failed) errors.add_error(*error_);
  return false;
}

void Csv::fail(const CellScan& scan) {
  state_ = State::FAILED;
  error_.emplace(scan.error, ErrorSeverity::FATAL, line_, column_ + 1, scan.error_offset,
                 syntax_error_message(scan.error), make_context(buf_, len_, scan.error_offset));
}

Csv& Csv::skip_rows(size_t n) {
  if (n == 0 || done()) return *this;

  if (state_ == State::ROW_END) {
    ++line_;
    state_ = State::CELL;
  }
  column_ = 0;

  size_t start = cursor_;
  for (size_t i = 0; i < n; ++i) {
    auto lf = find_next_of(buf_, len_, start, '\n');
    if (!lf) {
      cursor_ = len_;
      state_ = State::DONE;
      return *this;
    }
    start = *lf + 1;
    ++line_;
  }

  cursor_ = start;
  if (cursor_ >= len_) state_ = State::DONE;
  return *this;
}

} // namespace lazycsv
