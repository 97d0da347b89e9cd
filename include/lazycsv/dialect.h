/**
 * @file dialect.h
 * @brief Parser configuration: separator byte and decode allocation policy.
 *
 * The grammar is deliberately narrow. The quote byte is always '"', quotes
 * are escaped only by doubling, and rows end with "\n" or "\r\n". Only the
 * separator can be changed, and only at construction time.
 */

#ifndef LAZYCSV_DIALECT_H
#define LAZYCSV_DIALECT_H

#include <string>

namespace lazycsv {

/// The only quote byte the grammar accepts.
constexpr char QUOTE_CHAR = '"';

/**
 * @brief CSV dialect configuration.
 *
 * Fixed when a Csv is constructed and never changed afterwards.
 */
struct Dialect {
    char delimiter = ',';

    /// Factory for standard CSV (comma-separated)
    static Dialect csv() { return Dialect{','}; }

    /// Factory for TSV (tab-separated)
    static Dialect tsv() { return Dialect{'\t'}; }

    /// Factory for semicolon-separated (European style)
    static Dialect semicolon() { return Dialect{';'}; }

    /// Factory for pipe-separated
    static Dialect pipe() { return Dialect{'|'}; }

    /// A delimiter is usable if it does not collide with the quote or a
    /// newline byte.
    bool is_valid() const {
        return delimiter != QUOTE_CHAR && delimiter != '\n' && delimiter != '\r';
    }

    bool operator==(const Dialect& other) const { return delimiter == other.delimiter; }
    bool operator!=(const Dialect& other) const { return !(*this == other); }

    /// Returns a human-readable description of the dialect
    std::string to_string() const;
};

/**
 * @brief Whether the decoder may allocate to unescape doubled quotes.
 *
 * Building with LAZYCSV_NO_ALLOC removes the allocating path; ALLOWED then
 * behaves like FORBIDDEN.
 */
enum class Allocation {
    ALLOWED,
    FORBIDDEN
};

/// True when this build contains the allocating unescape path.
constexpr bool allocation_supported() {
#ifdef LAZYCSV_NO_ALLOC
    return false;
#else
    return true;
#endif
}

} // namespace lazycsv

#endif // LAZYCSV_DIALECT_H
