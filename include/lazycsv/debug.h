/**
 * @file debug.h
 * @brief Debug logging and phase timing for lazycsv tools.
 *
 * Everything is off by default. Output goes to DebugConfig::output, or stderr
 * when that is null, with a "[lazycsv]" prefix on every line.
 */

#ifndef LAZYCSV_DEBUG_H
#define LAZYCSV_DEBUG_H

#include "lazycsv/error.h"

#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace lazycsv {

struct DebugConfig {
    bool verbose = false;
    bool dump_buffers = false;
    bool timing = false;
    FILE* output = nullptr;
    size_t dump_context_bytes = 64;

    DebugConfig() = default;

    static DebugConfig all() {
        DebugConfig config;
        config.verbose = true;
        config.dump_buffers = true;
        config.timing = true;
        return config;
    }

    bool enabled() const {
        return verbose || dump_buffers || timing;
    }
};

struct PhaseTime {
    std::string name;
    std::chrono::nanoseconds duration;
    size_t bytes_processed = 0;

    double seconds() const {
        return duration.count() / 1e9;
    }

    double throughput_gbps() const {
        if (bytes_processed == 0 || duration.count() == 0) return 0.0;
        return (bytes_processed / 1e9) / seconds();
    }
};

/**
 * @class DebugTrace
 * @brief Provides debug logging and timing facilities.
 *
 * @note Thread Safety: This class is NOT thread-safe.
 */
class DebugTrace {
public:
    explicit DebugTrace(const DebugConfig& config = DebugConfig())
        : config_(config) {}

    bool enabled() const { return config_.enabled(); }
    bool verbose() const { return config_.verbose; }
    bool dump_buffers() const { return config_.dump_buffers; }
    bool timing() const { return config_.timing; }

    // The format attribute uses index 2 for fmt because 'this' is implicit parameter 1
    #if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
    #endif
    void log(const char* fmt, ...) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[lazycsv] ");
        va_list args;
        va_start(args, fmt);
        vfprintf(out, fmt, args);
        va_end(args);
        fprintf(out, "\n");
        fflush(out);
    }

    // Logs msg verbatim; use for user-provided strings.
    void log_str(const char* msg) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[lazycsv] %s\n", msg);
        fflush(out);
    }

    void log_simd_path(const char* target_name) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[lazycsv] SIMD: Using %s target\n", target_name);
        fflush(out);
    }

    void log_dialect(char delimiter) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        char delim_str[8];
        format_char(delimiter, delim_str, sizeof(delim_str));
        fprintf(out, "[lazycsv] DIALECT: delimiter='%s', quote='\"'\n", delim_str);
        fflush(out);
    }

    void log_error(const ParseError& error) const {
        if (!config_.verbose) return;
        FILE* out = stream();
        fprintf(out, "[lazycsv] ERROR: %s\n", error.to_string().c_str());
        fflush(out);
    }

    void dump_buffer(const char* name, const uint8_t* buf, size_t len, size_t offset = 0) const {
        if (!config_.dump_buffers) return;
        FILE* out = stream();
        size_t dump_len = (len < config_.dump_context_bytes) ? len : config_.dump_context_bytes;
        fprintf(out, "[lazycsv] BUFFER %s @ offset %zu (showing %zu of %zu bytes):\n",
                name, offset, dump_len, len);
        fprintf(out, "  hex: ");
        for (size_t i = 0; i < dump_len; ++i) {
            fprintf(out, "%02x ", buf[i]);
            if ((i + 1) % 16 == 0 && i + 1 < dump_len) {
                fprintf(out, "\n       ");
            }
        }
        fprintf(out, "\n");
        fflush(out);
    }

    void start_phase(const char* phase_name) {
        if (!config_.timing) return;
        current_phase_ = phase_name;
        phase_start_ = std::chrono::steady_clock::now();
    }

    void end_phase(size_t bytes_processed = 0) {
        if (!config_.timing) return;
        auto end = std::chrono::steady_clock::now();
        PhaseTime pt;
        pt.name = current_phase_;
        pt.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - phase_start_);
        pt.bytes_processed = bytes_processed;
        phase_times_.push_back(pt);
    }

    void print_timing_summary() const {
        if (!config_.timing || phase_times_.empty()) return;
        FILE* out = stream();
        fprintf(out, "\n[lazycsv] TIMING SUMMARY:\n");
        fprintf(out, "  %-30s %12s %12s %12s\n",
                "Phase", "Time (ms)", "Bytes", "Throughput");
        fprintf(out, "  %s\n", std::string(70, '-').c_str());

        std::chrono::nanoseconds total_time{0};
        size_t total_bytes = 0;

        for (const auto& pt : phase_times_) {
            double ms = pt.duration.count() / 1e6;
            fprintf(out, "  %-30s %12.3f %12zu",
                    pt.name.c_str(), ms, pt.bytes_processed);
            if (pt.bytes_processed > 0) {
                fprintf(out, " %9.2f GB/s", pt.throughput_gbps());
            }
            fprintf(out, "\n");
            total_time += pt.duration;
            total_bytes += pt.bytes_processed;
        }

        fprintf(out, "  %s\n", std::string(70, '-').c_str());
        double total_ms = total_time.count() / 1e6;
        fprintf(out, "  %-30s %12.3f %12zu", "TOTAL", total_ms, total_bytes);
        if (total_bytes > 0 && total_time.count() > 0) {
            double gbps = (total_bytes / 1e9) / (total_time.count() / 1e9);
            fprintf(out, " %9.2f GB/s", gbps);
        }
        fprintf(out, "\n\n");
        fflush(out);
    }

    const std::vector<PhaseTime>& get_phase_times() const {
        return phase_times_;
    }

    void clear_timing() {
        phase_times_.clear();
    }

private:
    DebugConfig config_;
    std::string current_phase_;
    std::chrono::steady_clock::time_point phase_start_;
    std::vector<PhaseTime> phase_times_;

    FILE* stream() const { return config_.output ? config_.output : stderr; }

    static void format_char(char c, char* buf, size_t buf_size) {
        if (c == '\t') snprintf(buf, buf_size, "\\t");
        else if (c >= 32 && c < 127) snprintf(buf, buf_size, "%c", c);
        else snprintf(buf, buf_size, "\\x%02x", (unsigned char)c);
    }
};

class ScopedPhaseTimer {
public:
    ScopedPhaseTimer(DebugTrace& trace, const char* phase_name, size_t bytes = 0)
        : trace_(trace), bytes_(bytes) {
        trace_.start_phase(phase_name);
    }

    ~ScopedPhaseTimer() {
        trace_.end_phase(bytes_);
    }

    ScopedPhaseTimer(const ScopedPhaseTimer&) = delete;
    ScopedPhaseTimer& operator=(const ScopedPhaseTimer&) = delete;

    void set_bytes(size_t bytes) { bytes_ = bytes; }

private:
    DebugTrace& trace_;
    size_t bytes_;
};

#define LAZYCSV_CONCAT_IMPL(a, b) a##b
#define LAZYCSV_CONCAT(a, b) LAZYCSV_CONCAT_IMPL(a, b)
#define LAZYCSV_TIMED_PHASE(trace, name, bytes) \
    lazycsv::ScopedPhaseTimer LAZYCSV_CONCAT(_phase_timer_, __LINE__)(trace, name, bytes)

namespace debug {

inline DebugConfig& global_config() {
    static DebugConfig config;
    return config;
}

// Must be called before the first global_trace() to take effect.
inline void set_config(const DebugConfig& config) {
    global_config() = config;
}

inline DebugTrace& global_trace() {
    static DebugTrace trace(global_config());
    return trace;
}

inline bool enabled() {
    return global_config().enabled();
}

}  // namespace debug

}  // namespace lazycsv

#endif  // LAZYCSV_DEBUG_H
