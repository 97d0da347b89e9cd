#ifndef LAZYCSV_ERROR_H
#define LAZYCSV_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace lazycsv {

// CSV Error Types
enum class ErrorCode {
    NONE = 0,

    // Quote-related errors
    UNCLOSED_QUOTE,              // Quoted field not closed before end of buffer
    INVALID_QUOTE_ESCAPE,        // Closing quote followed by something other than a delimiter
    QUOTE_IN_UNQUOTED_FIELD,     // Quote appears in the body of an unquoted field

    // Line ending errors
    INVALID_LINE_ENDING,         // Bare '\r' not followed by '\n'

    // Row shape errors
    INCONSISTENT_FIELD_COUNT,    // Row has a different number of fields than expected

    // Decoding errors
    INVALID_UTF8,                // Cell bytes are not well-formed UTF-8
    ALLOCATION_DISABLED,         // Unescaping needs a copy but allocation is not permitted

    // General errors
    IO_ERROR                     // File I/O error
};

// Error severity levels
enum class ErrorSeverity {
    ERROR,      // Local to one row or cell, iteration may continue
    FATAL       // Stops the scan (syntax errors)
};

// Detailed error information
struct ParseError {
    ErrorCode code;
    ErrorSeverity severity;

    // Location information
    size_t line;          // Row number (1-indexed)
    size_t column;        // Field number within the row (1-indexed)
    size_t byte_offset;   // Byte offset in buffer

    // Context
    std::string message;  // Human-readable error message
    std::string context;  // Snippet of problematic data

    ParseError(ErrorCode c, ErrorSeverity s, size_t l, size_t col,
               size_t offset, const std::string& msg, const std::string& ctx = "")
        : code(c), severity(s), line(l), column(col),
          byte_offset(offset), message(msg), context(ctx) {}

    std::string to_string() const;
};

// Error handling modes
enum class ErrorMode {
    STRICT,      // Stop on first error
    PERMISSIVE   // Keep going past row and cell errors, stop on FATAL
};

// Error collector - accumulates errors reported by the engine, the row
// adapter and the decoder.
class ErrorCollector {
public:
    explicit ErrorCollector(ErrorMode mode = ErrorMode::STRICT)
        : mode_(mode), has_fatal_(false) {}

    void add_error(const ParseError& error) {
        errors_.push_back(error);
        if (error.severity == ErrorSeverity::FATAL) {
            has_fatal_ = true;
        }
    }

    void add_error(ErrorCode code, ErrorSeverity severity, size_t line,
                   size_t column, size_t offset, const std::string& message,
                   const std::string& context = "") {
        add_error(ParseError(code, severity, line, column, offset, message, context));
    }

    // Check if we should stop parsing
    bool should_stop() const {
        if (mode_ == ErrorMode::STRICT && !errors_.empty()) return true;
        return has_fatal_;
    }

    bool has_errors() const { return !errors_.empty(); }
    bool has_fatal_errors() const { return has_fatal_; }
    size_t error_count() const { return errors_.size(); }
    const std::vector<ParseError>& errors() const { return errors_; }

    std::string summary() const;

    void clear() {
        errors_.clear();
        has_fatal_ = false;
    }

private:
    ErrorMode mode_;
    std::vector<ParseError> errors_;
    bool has_fatal_;
};

// Exception thrown by the throwing convenience paths (range-for iteration,
// DecodeResult::get()).
class ParseException : public std::runtime_error {
public:
    explicit ParseException(const ParseError& error)
        : std::runtime_error(error.message), errors_{error} {}

    explicit ParseException(const std::vector<ParseError>& errors)
        : std::runtime_error(format_errors(errors)), errors_(errors) {}

    const ParseError& error() const {
        if (errors_.empty()) throw std::logic_error("No errors in ParseException");
        return errors_[0];
    }

    const std::vector<ParseError>& errors() const { return errors_; }

private:
    std::vector<ParseError> errors_;

    static std::string format_errors(const std::vector<ParseError>& errors);
};

const char* error_code_to_string(ErrorCode code);
const char* error_severity_to_string(ErrorSeverity severity);

} // namespace lazycsv

#endif // LAZYCSV_ERROR_H
