#include "lazycsv/error.h"
#include <sstream>

namespace lazycsv {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::UNCLOSED_QUOTE: return "UNCLOSED_QUOTE";
        case ErrorCode::INVALID_QUOTE_ESCAPE: return "INVALID_QUOTE_ESCAPE";
        case ErrorCode::QUOTE_IN_UNQUOTED_FIELD: return "QUOTE_IN_UNQUOTED_FIELD";
        case ErrorCode::INVALID_LINE_ENDING: return "INVALID_LINE_ENDING";
        case ErrorCode::INCONSISTENT_FIELD_COUNT: return "INCONSISTENT_FIELD_COUNT";
        case ErrorCode::INVALID_UTF8: return "INVALID_UTF8";
        case ErrorCode::ALLOCATION_DISABLED: return "ALLOCATION_DISABLED";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

const char* error_severity_to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string ParseError::to_string() const {
    std::ostringstream ss;
    ss << "[" << error_severity_to_string(severity) << "] "
       << error_code_to_string(code) << " at line " << line
       << ", column " << column << " (byte " << byte_offset << "): "
       << message;

    if (!context.empty()) {
        ss << "\n  Context: " << context;
    }

    return ss.str();
}

std::string ErrorCollector::summary() const {
    if (errors_.empty()) {
        return "No errors";
    }

    std::ostringstream ss;
    size_t errors = 0, fatal = 0;

    for (const auto& err : errors_) {
        switch (err.severity) {
            case ErrorSeverity::ERROR: errors++; break;
            case ErrorSeverity::FATAL: fatal++; break;
        }
    }

    ss << "Total errors: " << errors_.size() << " (";
    const char* sep = "";
    if (errors > 0) { ss << sep << "Errors: " << errors; sep = ", "; }
    if (fatal > 0) { ss << sep << "Fatal: " << fatal; }
    ss << ")";

    ss << "\n\nDetails:\n";
    for (const auto& err : errors_) {
        ss << err.to_string() << "\n";
    }

    return ss.str();
}

std::string ParseException::format_errors(const std::vector<ParseError>& errors) {
    if (errors.empty()) return "Parse error";
    if (errors.size() == 1) return errors[0].message;

    std::ostringstream ss;
    ss << "Multiple parse errors (" << errors.size() << "):\n";
    for (const auto& err : errors) {
        ss << "  - " << err.to_string() << "\n";
    }
    return ss.str();
}

} // namespace lazycsv
