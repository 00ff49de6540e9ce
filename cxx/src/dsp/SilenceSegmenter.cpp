/**
 * @file SilenceSegmenter.cpp
 * @brief Sliding-window silence detection over a prefix sum of squares.
 */

#include "SilenceSegmenter.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace wavchunk {

namespace {

/**
 * @brief O(1) RMS of any frame range after one O(n) pass.
 */
class EnergyIndex {
public:
    explicit EnergyIndex(const AudioBuffer& audio)
        : channels_(static_cast<size_t>(std::max(1, audio.channels())))
    {
        const auto samples = audio.samples();
        const size_t frames = audio.frames();
        prefix_.resize(frames + 1, 0.0);
        for (size_t f = 0; f < frames; ++f) {
            double frame_sq = 0.0;
            for (size_t c = 0; c < channels_; ++c) {
                const double s = samples[f * channels_ + c];
                frame_sq += s * s;
            }
            prefix_[f + 1] = prefix_[f] + frame_sq;
        }
    }

    double rms(size_t start_frame, size_t end_frame) const {
        end_frame = std::min(end_frame, prefix_.size() - 1);
        if (end_frame <= start_frame) {
            return 0.0;
        }
        const double sum_sq = std::max(0.0, prefix_[end_frame] - prefix_[start_frame]);
        const double count = static_cast<double>((end_frame - start_frame) * channels_);
        return std::sqrt(sum_sq / count);
    }

private:
    size_t channels_;
    std::vector<double> prefix_;
};

} // namespace

SilenceSegmenter::SilenceSegmenter(int min_silence_len_ms, double silence_thresh_db)
    : min_silence_len_ms_(std::max(1, min_silence_len_ms))
    , silence_thresh_db_(silence_thresh_db)
{
}

std::vector<TimeRange> SilenceSegmenter::detect_silence(const AudioBuffer& audio) const {
    std::vector<TimeRange> ranges;
    const int64_t length = audio.duration_ms();
    const int64_t window = min_silence_len_ms_;
    if (length < window) {
        return ranges;
    }

    const double threshold = AudioBuffer::db_to_amplitude(silence_thresh_db_);
    const EnergyIndex energy(audio);

    bool in_range = false;
    int64_t range_start = 0;
    int64_t prev_start = 0;

    const int64_t last_start = length - window;
    for (int64_t i = 0; i <= last_start; ++i) {
        const double level = energy.rms(audio.ms_to_frames(i), audio.ms_to_frames(i + window));
        if (level > threshold) {
            continue;
        }

        if (!in_range) {
            in_range = true;
            range_start = i;
        } else if (i > prev_start + window) {
            // Gap between this window and the previous one: close the range
            ranges.push_back({range_start, prev_start + window});
            range_start = i;
        }
        prev_start = i;
    }

    if (in_range) {
        ranges.push_back({range_start, prev_start + window});
    }
    return ranges;
}

std::vector<TimeRange> SilenceSegmenter::detect_nonsilent(const AudioBuffer& audio) const {
    std::vector<TimeRange> spans;
    const int64_t length = audio.duration_ms();
    if (length <= 0) {
        return spans;
    }

    const auto silent = detect_silence(audio);
    if (silent.empty()) {
        // Too short to hold a qualifying run: drop it only if it is silent throughout
        if (length < min_silence_len_ms_ &&
            audio.rms() <= AudioBuffer::db_to_amplitude(silence_thresh_db_)) {
            return spans;
        }
        spans.push_back({0, length});
        return spans;
    }

    int64_t prev_end = 0;
    for (const auto& range : silent) {
        if (range.start_ms > prev_end) {
            spans.push_back({prev_end, range.start_ms});
        }
        prev_end = range.end_ms;
    }
    if (prev_end < length) {
        spans.push_back({prev_end, length});
    }
    return spans;
}

std::vector<AudioBuffer> SilenceSegmenter::split(const AudioBuffer& audio) const {
    std::vector<AudioBuffer> phrases;
    for (const auto& span : detect_nonsilent(audio)) {
        AudioBuffer phrase = audio.slice(span.start_ms, span.end_ms);
        if (!phrase.empty()) {
            phrases.push_back(std::move(phrase));
        }
    }
    return phrases;
}

} // namespace wavchunk
