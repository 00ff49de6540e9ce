/**
 * @file QuietPointSplitter.hpp
 * @brief Splits oversized phrases at their quietest point near the middle.
 */

#ifndef WAVCHUNK_QUIET_POINT_SPLITTER_HPP
#define WAVCHUNK_QUIET_POINT_SPLITTER_HPP

#include "AudioBuffer.hpp"
#include <cstdint>
#include <vector>

namespace wavchunk {

/**
 * @brief Recursive midpoint-biased splitter.
 *
 * A segment longer than max_len_ms is cut at the lowest-RMS step window
 * inside a search window centered on its midpoint. The left piece gets a
 * fade-out and the right piece a fade-in. Pieces still above max_len_ms
 * are split again. Output order is the input's temporal order.
 */
class QuietPointSplitter {
public:
    struct Settings {
        int64_t max_len_ms = 5000;
        int64_t fade_ms = 10;
        int64_t search_range_ms = 1000;
        int64_t search_step_ms = 50;
    };

    explicit QuietPointSplitter(const Settings& settings);

    /**
     * @brief Cut position in ms for a segment, in (0, duration).
     *
     * Segments no longer than the search range are cut at their midpoint.
     * Otherwise the midpoint of the quietest step window wins, the earliest
     * one on ties.
     */
    int64_t find_split_point(const AudioBuffer& segment) const;

    /**
     * @brief Sub-segments, each no longer than max_len_ms.
     *
     * A segment that already fits is returned unchanged as the only element.
     */
    std::vector<AudioBuffer> split(const AudioBuffer& segment) const;

    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
};

} // namespace wavchunk

#endif // WAVCHUNK_QUIET_POINT_SPLITTER_HPP
