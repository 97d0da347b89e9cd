/**
 * @file cell_recognizer.h
 * @brief Recognizes the extent of exactly one cell at a cursor.
 */

#ifndef LAZYCSV_CELL_RECOGNIZER_H
#define LAZYCSV_CELL_RECOGNIZER_H

#include "lazycsv/cell.h"
#include "lazycsv/dialect.h"
#include "lazycsv/error.h"

#include <cstddef>
#include <cstdint>

namespace lazycsv {

/// What ended a recognized cell.
enum class Terminator {
    SEPARATOR,      ///< The dialect delimiter; the row continues
    NEWLINE,        ///< "\n" or "\r\n"; the row ends
    END_OF_BUFFER   ///< Nothing left; the row ends
};

/**
 * Outcome of one recognizer step. On success `cell` and `next` are set; on
 * failure `error` names the violation and `error_offset` the offending byte.
 */
struct CellScan {
    Cell cell;
    size_t next = 0;
    Terminator terminator = Terminator::END_OF_BUFFER;
    ErrorCode error = ErrorCode::NONE;
    size_t error_offset = 0;

    bool ok() const { return error == ErrorCode::NONE; }
};

/**
 * @brief Recognize the cell starting at pos.
 *
 * A cell is quoted when buf[pos] is '"'. Quoted cells run to the first quote
 * that is not immediately followed by another quote and must be followed by
 * end of buffer, the delimiter, "\n" or "\r\n". Unquoted cells run to the
 * next delimiter, "\n" or "\r" and may not contain a quote at all.
 *
 * pos == len is valid and yields an empty unquoted cell ended by
 * END_OF_BUFFER (the cell after a trailing delimiter).
 *
 * @param buf     Buffer start
 * @param len     Buffer length
 * @param pos     Cursor, pos <= len
 * @param dialect Delimiter configuration
 */
CellScan recognize_cell(const uint8_t* buf, size_t len, size_t pos, const Dialect& dialect);

} // namespace lazycsv

#endif // LAZYCSV_CELL_RECOGNIZER_H
