/**
 * @file cell.h
 * @brief Cell references and the lazy cell decoder.
 *
 * A Cell is a pointer, a length, a buffer offset and a quoted flag. It
 * borrows from the caller's buffer and performs no work until text is
 * requested. The buffer must outlive every Cell and every borrowed CellText
 * derived from it.
 *
 * Three levels of access are offered:
 * - raw(): the bytes as they sit in the buffer, no validation, no unescaping.
 * - try_as_borrowed_str(): validated text, never allocates; fails with
 *   ALLOCATION_DISABLED when the cell contains doubled quotes.
 * - try_as_str(): validated text, allocates only to collapse doubled quotes.
 */

#ifndef LAZYCSV_CELL_H
#define LAZYCSV_CELL_H

#include "lazycsv/dialect.h"
#include "lazycsv/error.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace lazycsv {

/// Builds the ParseError reported for a failed decode.
ParseError make_decode_error(ErrorCode code, size_t byte_offset);

/// Throws ParseException for a failed decode.
void throw_decode_error(ErrorCode code, size_t byte_offset);

/**
 * Result structure for decode operations.
 * Contains either a decoded value or the reason decoding failed.
 */
template <typename T>
struct DecodeResult {
    std::optional<T> value;
    ErrorCode error = ErrorCode::NONE;
    size_t error_offset = 0;  ///< Absolute buffer offset of the failure

    static DecodeResult success(T v) {
        DecodeResult r;
        r.value = std::move(v);
        return r;
    }

    static DecodeResult failure(ErrorCode code, size_t offset) {
        DecodeResult r;
        r.error = code;
        r.error_offset = offset;
        return r;
    }

    bool ok() const { return value.has_value(); }

    const T& get() const& {
        if (!value.has_value()) {
            throw_decode_error(error, error_offset);
        }
        return *value;
    }

    T get() && {
        if (!value.has_value()) {
            throw_decode_error(error, error_offset);
        }
        return std::move(*value);
    }

    ParseError to_error() const { return make_decode_error(error, error_offset); }
};

/**
 * @brief Decoded cell text: either a view into the buffer or an owned copy.
 *
 * is_borrowed() reports which path produced it. view() of an owned value is
 * valid for as long as the CellText itself.
 */
class CellText {
public:
    CellText() = default;

    static CellText borrowed(std::string_view text) {
        CellText t;
        t.borrowed_ = text;
        return t;
    }

    static CellText owned(std::string text) {
        CellText t;
        t.owned_ = std::move(text);
        t.is_owned_ = true;
        return t;
    }

    std::string_view view() const {
        return is_owned_ ? std::string_view(owned_) : borrowed_;
    }

    bool is_borrowed() const { return !is_owned_; }
    size_t size() const { return view().size(); }
    bool empty() const { return view().empty(); }

    std::string to_string() const { return std::string(view()); }

    std::string into_string() && {
        if (is_owned_) return std::move(owned_);
        return std::string(borrowed_);
    }

    bool operator==(std::string_view other) const { return view() == other; }
    bool operator!=(std::string_view other) const { return view() != other; }

private:
    std::string_view borrowed_;
    std::string owned_;
    bool is_owned_ = false;
};

inline std::ostream& operator<<(std::ostream& os, const CellText& text) {
    return os << text.view();
}

/**
 * @brief One field of a row, referenced by extent and quoted flag.
 *
 * For quoted cells the extent excludes the surrounding quotes but may still
 * contain doubled quotes awaiting decode.
 */
class Cell {
public:
    Cell() = default;

    Cell(const uint8_t* data, size_t size, size_t offset, bool quoted)
        : data_(data), size_(size), offset_(offset), quoted_(quoted) {}

    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    /// Offset of the first content byte in the buffer.
    size_t start() const { return offset_; }
    /// Offset one past the last content byte in the buffer.
    size_t end() const { return offset_ + size_; }

    bool quoted() const { return quoted_; }

    /// The unmodified bytes. No UTF-8 validation and no unescaping.
    std::string_view raw() const {
        return std::string_view(reinterpret_cast<const char*>(data_), size_);
    }

    /// Number of doubled-quote pairs in the extent (always 0 when unquoted).
    size_t escaped_quote_count() const;

    /**
     * @brief Validate and, if needed, unescape the cell.
     *
     * Plain cells and quoted cells without doubled quotes come back borrowed.
     * Quoted cells with doubled quotes are copied into an owned string sized
     * exactly size() - escaped_quote_count(); with Allocation::FORBIDDEN (or
     * in a LAZYCSV_NO_ALLOC build) they fail with ALLOCATION_DISABLED.
     */
    DecodeResult<CellText> try_as_str(Allocation alloc = Allocation::ALLOWED) const;

    /// Zero-copy text or ALLOCATION_DISABLED; never allocates.
    DecodeResult<std::string_view> try_as_borrowed_str() const;

    bool operator==(const Cell& other) const {
        return quoted_ == other.quoted_ && raw() == other.raw();
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }

    bool operator<(const Cell& other) const {
        if (quoted_ != other.quoted_) return !quoted_;
        return raw() < other.raw();
    }

private:
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t offset_ = 0;
    bool quoted_ = false;
};

} // namespace lazycsv

namespace std {

template <>
struct hash<lazycsv::Cell> {
    size_t operator()(const lazycsv::Cell& cell) const noexcept {
        size_t h = hash<string_view>()(cell.raw());
        return cell.quoted() ? ~h : h;
    }
};

} // namespace std

#endif // LAZYCSV_CELL_H
