/**
 * @file csv.h
 * @brief The iterator engine and the fixed-width row adapter.
 *
 * Csv walks a caller-owned buffer and yields a flat sequence of items: the
 * cells of a row followed by exactly one ROW_END marker. The final row is
 * always closed by a ROW_END, whether or not the buffer ends with a newline,
 * and a trailing newline never produces an extra empty row.
 *
 * @code
 * lazycsv::Csv csv("a,b,c\n1,2,3");
 * lazycsv::CsvItem item;
 * while (csv.next(item)) {
 *   if (item.is_cell()) use(item.cell.try_as_str().get());
 * }
 * if (csv.failed()) report(*csv.error());
 *
 * for (const auto& row : lazycsv::Csv("a,b,c\n1,2,3").into_rows<3>()) {
 *   // row is std::array<lazycsv::Cell, 3>
 * }
 * @endcode
 *
 * @note Thread Safety: a Csv is a single-owner cursor. Independent Csv
 *       objects may scan the same buffer from different threads.
 */

#ifndef LAZYCSV_CSV_H
#define LAZYCSV_CSV_H

#include "lazycsv/cell.h"
#include "lazycsv/dialect.h"
#include "lazycsv/error.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace lazycsv {

struct CellScan;

/// An item yielded by Csv: either a cell or the end of a row.
struct CsvItem {
    enum class Kind { CELL, ROW_END };

    Kind kind = Kind::ROW_END;
    Cell cell;  ///< Only meaningful when kind == CELL

    static CsvItem make_cell(const Cell& c) { return CsvItem{Kind::CELL, c}; }
    static CsvItem row_end() { return CsvItem{Kind::ROW_END, Cell()}; }

    bool is_cell() const { return kind == Kind::CELL; }
    bool is_row_end() const { return kind == Kind::ROW_END; }
};

template <size_t COLS> class RowIterator;

/**
 * @brief Forward-only CSV scanner over a borrowed buffer.
 *
 * A syntax error ends the scan: next() returns false, error() describes the
 * problem, and every later call returns false with the same error.
 */
class Csv {
public:
    /**
     * @throws std::invalid_argument if the dialect delimiter is '"', '\n'
     *         or '\r'.
     */
    Csv(const uint8_t* buf, size_t len, const Dialect& dialect = Dialect::csv());

    explicit Csv(std::string_view data, const Dialect& dialect = Dialect::csv())
        : Csv(reinterpret_cast<const uint8_t*>(data.data()), data.size(), dialect) {}

    // The engine only borrows its input, so a temporary std::string would be
    // destroyed before the first next(). Lvalue strings and literals still
    // bind to the string_view constructor.
    template <typename S, typename std::enable_if<
                              std::is_same<typename std::remove_const<S>::type,
                                           std::string>::value,
                              int>::type = 0>
    Csv(S&&, const Dialect& = Dialect::csv()) = delete;

    /// Produce the next item. Returns false at the end or on a syntax error.
    bool next(CsvItem& item);

    /// As next(item), and records a syntax error in errors.
    bool next(CsvItem& item, ErrorCollector& errors);

    /// The syntax error that stopped the scan, or nullptr.
    const ParseError* error() const { return error_ ? &*error_ : nullptr; }

    bool failed() const { return state_ == State::FAILED; }
    bool done() const { return state_ == State::DONE || state_ == State::FAILED; }

    /// Current cursor offset into the buffer.
    size_t position() const { return cursor_; }

    /// 1-based number of the row currently being scanned.
    size_t line() const { return line_; }

    const Dialect& dialect() const { return dialect_; }
    const uint8_t* data() const { return buf_; }
    size_t size() const { return len_; }

    /**
     * @brief Skip the next n rows.
     *
     * Only looks for raw '\n' bytes instead of recognizing cells, so it is
     * much cheaper than reading the rows, but a newline inside a quoted cell
     * counts as a row end. When called with a pending ROW_END, the marker is
     * consumed first and the count starts at the next row.
     */
    Csv& skip_rows(size_t n);

    /// Groups the remaining items into rows of exactly COLS cells.
    template <size_t COLS> RowIterator<COLS> into_rows() const;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = CsvItem;
        using difference_type = std::ptrdiff_t;
        using pointer = const CsvItem*;
        using reference = const CsvItem&;

        iterator() = default;
        explicit iterator(Csv* csv) : csv_(csv) { advance(); }

        reference operator*() const { return item_; }
        pointer operator->() const { return &item_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return csv_ == other.csv_; }
        bool operator!=(const iterator& other) const { return csv_ != other.csv_; }

    private:
        // Throws ParseException when the scan stops on a syntax error.
        void advance() {
            if (csv_ == nullptr || csv_->next(item_)) return;
            Csv* finished = csv_;
            csv_ = nullptr;
            if (finished->failed()) throw ParseException(*finished->error());
        }

        Csv* csv_ = nullptr;
        CsvItem item_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    enum class State { CELL, ROW_END, DONE, FAILED };

    void fail(const CellScan& scan);

    const uint8_t* buf_;
    size_t len_;
    Dialect dialect_;
    State state_;
    size_t cursor_ = 0;
    size_t line_ = 1;
    size_t column_ = 0;  // cells already yielded in the current row
    std::optional<ParseError> error_;
};

/**
 * @brief Buffers the engine's items into fixed-width rows.
 *
 * Every row must hold exactly COLS cells. A short or long row is reported as
 * INCONSISTENT_FIELD_COUNT and, like an engine syntax error, stops the
 * iterator; rows are never padded or truncated.
 */
template <size_t COLS>
class RowIterator {
    static_assert(COLS > 0, "RowIterator needs at least one column");

public:
    using Row = std::array<Cell, COLS>;

    explicit RowIterator(const Csv& csv) : csv_(csv) {}

    /// Read the next row. Returns false at the end or on any error.
    bool next(Row& row) {
        if (stopped_) return false;

        const size_t row_line = csv_.line();
        CsvItem item;
        for (size_t i = 0; i < COLS; ++i) {
            if (!csv_.next(item)) {
                stopped_ = true;
                if (csv_.failed()) {
                    error_ = *csv_.error();
                } else if (i != 0) {
                    shape_error(row_line, i, "new row started");
                }
                return false;
            }
            if (item.is_row_end()) {
                shape_error(row_line, i, "new row started");
                return false;
            }
            row[i] = item.cell;
        }

        if (!csv_.next(item)) {
            stopped_ = true;
            if (csv_.failed()) error_ = *csv_.error();
            return false;
        }
        if (!item.is_row_end()) {
            shape_error(row_line, COLS + 1, "no newline found");
            return false;
        }

        ++rows_read_;
        return true;
    }

    /// As next(row), and records any error in errors.
    bool next(Row& row, ErrorCollector& errors) {
        const bool had_error = error_.has_value();
        if (next(row)) return true;
        if (error_ && !had_error) errors.add_error(*error_);
        return false;
    }

    /// Skip n rows; see Csv::skip_rows for the cost and quoting caveat.
    RowIterator& skip(size_t n) {
        csv_.skip_rows(n);
        return *this;
    }

    const ParseError* error() const { return error_ ? &*error_ : nullptr; }
    bool failed() const { return error_.has_value(); }
    size_t rows_read() const { return rows_read_; }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Row;
        using difference_type = std::ptrdiff_t;
        using pointer = const Row*;
        using reference = const Row&;

        iterator() = default;
        explicit iterator(RowIterator* rows) : rows_(rows) { advance(); }

        reference operator*() const { return row_; }
        pointer operator->() const { return &row_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return rows_ == other.rows_; }
        bool operator!=(const iterator& other) const { return rows_ != other.rows_; }

    private:
        void advance() {
            if (rows_ == nullptr || rows_->next(row_)) return;
            RowIterator* finished = rows_;
            rows_ = nullptr;
            if (finished->failed()) throw ParseException(*finished->error());
        }

        RowIterator* rows_ = nullptr;
        Row row_{};
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    void shape_error(size_t row_line, size_t actual, const char* what) {
        stopped_ = true;
        std::string message = "expected " + std::to_string(COLS) + " columns, but " + what +
                              " after parsing " +
                              std::to_string(actual > COLS ? COLS : actual) + " columns";
        error_.emplace(ErrorCode::INCONSISTENT_FIELD_COUNT, ErrorSeverity::ERROR, row_line,
                       actual, csv_.position(), message);
    }

    Csv csv_;
    std::optional<ParseError> error_;
    size_t rows_read_ = 0;
    bool stopped_ = false;
};

template <size_t COLS>
RowIterator<COLS> Csv::into_rows() const {
    return RowIterator<COLS>(*this);
}

} // namespace lazycsv

#endif // LAZYCSV_CSV_H
