#include "lazycsv/cell_recognizer.h"

#include "lazycsv/boundary_scanner.h"
#include "lazycsv/common_defs.h"

namespace lazycsv {

namespace {

constexpr uint8_t QUOTE = static_cast<uint8_t>(QUOTE_CHAR);
constexpr uint8_t LF = '\n';
constexpr uint8_t CR = '\r';

really_inline void fail(CellScan& scan, ErrorCode code, size_t offset) {
  scan.cell = Cell();
  scan.error = code;
  scan.error_offset = offset;
}

// Consume whatever follows a cell body at pos. After an unquoted body this
// is always a delimiter, LF, CR or the end; after a closing quote it can be
// anything.
really_inline void consume_terminator(const uint8_t* buf, size_t len, size_t pos, uint8_t sep,
                                      CellScan& scan) {
  if (pos >= len) {
    scan.next = len;
    scan.terminator = Terminator::END_OF_BUFFER;
    return;
  }

  const uint8_t c = buf[pos];
  if (c == sep) {
    scan.next = pos + 1;
    scan.terminator = Terminator::SEPARATOR;
  } else if (c == LF) {
    scan.next = pos + 1;
    scan.terminator = Terminator::NEWLINE;
  } else if (c == CR) {
    if (pos + 1 < len && buf[pos + 1] == LF) {
      scan.next = pos + 2;
      scan.terminator = Terminator::NEWLINE;
    } else {
      fail(scan, ErrorCode::INVALID_LINE_ENDING, pos);
    }
  } else {
    fail(scan, ErrorCode::INVALID_QUOTE_ESCAPE, pos);
  }
}

} // namespace

CellScan recognize_cell(const uint8_t* buf, size_t len, size_t pos, const Dialect& dialect) {
  CellScan scan;
  const uint8_t sep = static_cast<uint8_t>(dialect.delimiter);

  if (pos < len && buf[pos] == QUOTE) {
    size_t cursor = pos + 1;
    for (;;) {
      auto q = find_next_of(buf, len, cursor, QUOTE);
      if (!q) {
        fail(scan, ErrorCode::UNCLOSED_QUOTE, pos);
        return scan;
      }
      if (*q + 1 < len && buf[*q + 1] == QUOTE) {
        // Escaped quote
        cursor = *q + 2;
        continue;
      }
      scan.cell = Cell(buf + pos + 1, *q - (pos + 1), pos + 1, true);
      consume_terminator(buf, len, *q + 1, sep, scan);
      return scan;
    }
  }

  auto found = find_next_of(buf, len, pos, sep, LF, CR);
  const size_t stop = found ? *found : len;

  // Eager check: a quote anywhere in an unquoted body is a syntax error
  if (auto q = find_next_of(buf, stop, pos, QUOTE)) {
    fail(scan, ErrorCode::QUOTE_IN_UNQUOTED_FIELD, *q);
    return scan;
  }

  scan.cell = Cell(buf + pos, stop - pos, pos, false);
  consume_terminator(buf, len, stop, sep, scan);
  return scan;
}

} // namespace lazycsv
