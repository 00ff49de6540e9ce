/**
 * @file SilenceSegmenter.hpp
 * @brief Cuts a recording into phrases at runs of silence.
 */

#ifndef WAVCHUNK_SILENCE_SEGMENTER_HPP
#define WAVCHUNK_SILENCE_SEGMENTER_HPP

#include "AudioBuffer.hpp"
#include <cstdint>
#include <vector>

namespace wavchunk {

/**
 * @brief Half-open millisecond range [start_ms, end_ms).
 */
struct TimeRange {
    int64_t start_ms = 0;
    int64_t end_ms = 0;

    int64_t length_ms() const { return end_ms - start_ms; }
    bool operator==(const TimeRange&) const = default;
};

/**
 * @brief Amplitude-threshold silence detector and splitter.
 *
 * A window of min_silence_len ms is slid over the input in 1 ms steps; a
 * window whose RMS is at or below silence_thresh (dBFS) is silent.
 * Overlapping or touching silent windows form one silent range. The
 * non-silent complements become the output phrases, with no silence kept
 * at their edges.
 */
class SilenceSegmenter {
public:
    SilenceSegmenter(int min_silence_len_ms, double silence_thresh_db);

    /**
     * @brief Silent ranges, in order, each at least min_silence_len long.
     */
    std::vector<TimeRange> detect_silence(const AudioBuffer& audio) const;

    /**
     * @brief Non-silent ranges, in order.
     *
     * Empty when the input is empty or entirely silent.
     */
    std::vector<TimeRange> detect_nonsilent(const AudioBuffer& audio) const;

    /**
     * @brief Non-silent phrases as independent buffers.
     */
    std::vector<AudioBuffer> split(const AudioBuffer& audio) const;

    int min_silence_len_ms() const { return min_silence_len_ms_; }
    double silence_thresh_db() const { return silence_thresh_db_; }

private:
    int min_silence_len_ms_;
    double silence_thresh_db_;
};

} // namespace wavchunk

#endif // WAVCHUNK_SILENCE_SEGMENTER_HPP
