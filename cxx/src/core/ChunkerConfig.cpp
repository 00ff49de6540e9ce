#include "ChunkerConfig.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace wavchunk {

bool ChunkerConfig::validate(std::string& reason) const {
    if (min_silence_len <= 0) {
        reason = "min_silence_len must be positive";
        return false;
    }
    if (!std::isfinite(silence_thresh) || silence_thresh > 0.0) {
        reason = "silence_thresh must be a finite dBFS value <= 0";
        return false;
    }
    if (!std::isfinite(min_sec) || min_sec < 0.0) {
        reason = "min_sec must be >= 0";
        return false;
    }
    if (!std::isfinite(max_sec) || max_ms() < 1) {
        reason = "max_sec must be at least 1 ms";
        return false;
    }
    if (min_ms() > max_ms()) {
        reason = "min_sec must not exceed max_sec";
        return false;
    }
    if (!std::isfinite(ideal_pad_sec) || ideal_pad_sec < 0.0) {
        reason = "ideal_pad_sec must be >= 0";
        return false;
    }
    if (ideal_pad_ms() < min_ms()) {
        reason = "ideal_pad_sec must not be below min_sec";
        return false;
    }
    if (fade_ms < 0 || gap_ms < 0) {
        reason = "fade_ms and gap_ms must be >= 0";
        return false;
    }
    if (search_range_ms <= 0 || search_step_ms <= 0) {
        reason = "search_range_ms and search_step_ms must be positive";
        return false;
    }
    if (workers < 0) {
        reason = "workers must be >= 0";
        return false;
    }
    return true;
}

bool parse_value(const std::string& text, int& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool parse_value(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &end);
    if (*end != '\0' || errno == ERANGE || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

} // namespace wavchunk
