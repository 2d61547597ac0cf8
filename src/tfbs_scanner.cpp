/**
 * Motif Scanner - shared types, errors and logging
 */

#include "tfbs_scanner.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <tuple>

namespace tfbs {

// ============================================================================
// Logging
// ============================================================================

static LogLevel g_log_level = LogLevel::INFO;

void set_log_level(LogLevel level) {
    g_log_level = level;
}

LogLevel get_log_level() {
    return g_log_level;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        default:                level_str = "UNKNOWN"; break;
    }

    std::cerr << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S")
              << " - " << level_str << " - " << message << std::endl;
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    if (total_minutes < 60) {
        return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
    }

    const int64_t minutes = total_minutes % 60;
    const int64_t hours = total_minutes / 60;
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " +
           std::to_string(seconds) + "s";
}

// ============================================================================
// Errors
// ============================================================================

MalformedMatrixError::MalformedMatrixError(const std::string& motif_name,
                                           const std::string& message)
    : std::runtime_error("Malformed matrix for motif '" + motif_name + "': " + message),
      motif_name_(motif_name) {}

FileFormatError::FileFormatError(const std::string& message)
    : std::runtime_error("Invalid file format: " + message) {}

InvalidSequenceError::InvalidSequenceError(std::size_t position, const std::string& message)
    : std::runtime_error("Invalid sequence at position " + std::to_string(position) +
                         ": " + message),
      position_(position) {}

InvalidParameterError::InvalidParameterError(const std::string& name,
                                             const std::string& value,
                                             const std::string& message)
    : std::runtime_error("Invalid parameter: " + name + " = " + value + ", " + message),
      name_(name), value_(value) {}

// ============================================================================
// Strand and site utilities
// ============================================================================

char strand_to_char(Strand strand) {
    return strand == Strand::FORWARD ? 'F' : 'R';
}

Strand strand_from_char(char c) {
    switch (c) {
        case 'F': case 'f': case '+': return Strand::FORWARD;
        case 'R': case 'r': case '-': return Strand::REVERSE;
        default:
            throw std::invalid_argument(std::string("Unknown strand code: ") + c);
    }
}

bool site_order_less(const BindingSite& a, const BindingSite& b) {
    return std::tie(a.position, a.motif, a.strand) <
           std::tie(b.position, b.motif, b.strand);
}

void validate_scan_params(const ScanParams& params) {
    auto to_str = [](double v) {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    };

    if (!std::isfinite(params.mu)) {
        throw InvalidParameterError("mu", to_str(params.mu), "must be a finite number");
    }
    if (!(params.cutoff >= 0.0 && params.cutoff <= 1.0)) {
        throw InvalidParameterError("cutoff", to_str(params.cutoff), "must be within [0, 1]");
    }
}

} // namespace tfbs
