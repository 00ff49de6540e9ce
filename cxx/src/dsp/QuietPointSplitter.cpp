/**
 * @file QuietPointSplitter.cpp
 * @brief Quiet-point search and the work-list driven split.
 */

#include "QuietPointSplitter.hpp"
#include <algorithm>
#include <limits>
#include <utility>

namespace wavchunk {

QuietPointSplitter::QuietPointSplitter(const Settings& settings)
    : settings_(settings)
{
    settings_.max_len_ms = std::max<int64_t>(1, settings_.max_len_ms);
    settings_.fade_ms = std::max<int64_t>(0, settings_.fade_ms);
    settings_.search_range_ms = std::max<int64_t>(1, settings_.search_range_ms);
    settings_.search_step_ms = std::max<int64_t>(1, settings_.search_step_ms);
}

int64_t QuietPointSplitter::find_split_point(const AudioBuffer& segment) const {
    const int64_t length = segment.duration_ms();
    const int64_t mid = length / 2;
    if (length <= settings_.search_range_ms) {
        return mid;
    }

    const int64_t half_range = settings_.search_range_ms / 2;
    const int64_t step = settings_.search_step_ms;
    const int64_t search_start = std::max<int64_t>(0, mid - half_range);
    const int64_t search_end = std::min(length, mid + half_range);

    float min_rms = std::numeric_limits<float>::infinity();
    int64_t best = mid;
    for (int64_t i = search_start; i < search_end; i += step) {
        const float level = segment.rms(i, i + step);
        if (level < min_rms) {
            min_rms = level;
            best = i + step / 2;
        }
    }
    return best;
}

std::vector<AudioBuffer> QuietPointSplitter::split(const AudioBuffer& segment) const {
    std::vector<AudioBuffer> result;
    if (segment.duration_ms() <= settings_.max_len_ms) {
        result.push_back(segment);
        return result;
    }

    // Depth-first work list: the left piece is finished before the right one
    // is looked at, which reproduces the recursive cut order exactly.
    std::vector<AudioBuffer> pending;
    pending.push_back(segment);

    while (!pending.empty()) {
        AudioBuffer current = std::move(pending.back());
        pending.pop_back();

        if (current.duration_ms() <= settings_.max_len_ms || current.frames() < 2) {
            result.push_back(std::move(current));
            continue;
        }

        // Both halves must keep at least one frame so every cut makes progress
        const size_t cut = std::clamp<size_t>(current.ms_to_frames(find_split_point(current)),
                                              1, current.frames() - 1);

        AudioBuffer left = current.slice_frames(0, cut).fade_out(settings_.fade_ms);
        AudioBuffer right = current.slice_frames(cut, current.frames()).fade_in(settings_.fade_ms);

        pending.push_back(std::move(right));
        pending.push_back(std::move(left));
    }

    return result;
}

} // namespace wavchunk
