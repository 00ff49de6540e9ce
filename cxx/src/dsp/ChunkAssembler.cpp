/**
 * @file ChunkAssembler.cpp
 * @brief Greedy merge-or-pad pass over split segments.
 */

#include "ChunkAssembler.hpp"
#include <algorithm>
#include <utility>

namespace wavchunk {

ChunkAssembler::ChunkAssembler(const Settings& settings)
    : settings_(settings)
{
    settings_.fade_ms = std::max<int64_t>(0, settings_.fade_ms);
    settings_.gap_ms = std::max<int64_t>(0, settings_.gap_ms);
}

AudioBuffer ChunkAssembler::fade_merge(const AudioBuffer& a, const AudioBuffer& b) const {
    const AudioBuffer gap = AudioBuffer::silent(settings_.gap_ms, a.sample_rate(), a.channels());
    return AudioBuffer::concat(AudioBuffer::concat(a.fade_out(settings_.fade_ms), gap),
                               b.fade_in(settings_.fade_ms));
}

AudioBuffer ChunkAssembler::finalize(const AudioBuffer& buffer) const {
    if (buffer.duration_ms() < settings_.min_ms) {
        return buffer.pad_to(settings_.ideal_pad_ms);
    }
    return buffer;
}

std::vector<AudioBuffer> ChunkAssembler::assemble(const std::vector<AudioBuffer>& segments) const {
    std::vector<AudioBuffer> chunks;
    AudioBuffer buffer;

    for (const auto& segment : segments) {
        if (segment.empty()) {
            continue;
        }

        if (buffer.empty()) {
            buffer = segment;
            continue;
        }

        const int64_t merged_ms = buffer.duration_ms() + segment.duration_ms() + settings_.gap_ms;
        if (merged_ms <= settings_.max_ms) {
            buffer = fade_merge(buffer, segment);
        } else {
            chunks.push_back(finalize(buffer));
            buffer = segment;
        }
    }

    if (!buffer.empty()) {
        chunks.push_back(finalize(buffer));
    }
    return chunks;
}

} // namespace wavchunk
