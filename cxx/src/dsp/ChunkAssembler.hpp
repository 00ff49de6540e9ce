/**
 * @file ChunkAssembler.hpp
 * @brief Greedy merge-or-pad packing of segments into final chunks.
 */

#ifndef WAVCHUNK_CHUNK_ASSEMBLER_HPP
#define WAVCHUNK_CHUNK_ASSEMBLER_HPP

#include "AudioBuffer.hpp"
#include <cstdint>
#include <vector>

namespace wavchunk {

/**
 * @brief Single forward pass with one accumulation buffer.
 *
 * Each incoming segment is merged into the buffer (fade-out, gap of true
 * silence, fade-in) when the merged length would stay within max_ms.
 * Otherwise the buffer is flushed, padded with trailing silence to
 * ideal_pad_ms first if it is shorter than min_ms, and the segment starts
 * a new buffer. No look-ahead, no reordering.
 */
class ChunkAssembler {
public:
    struct Settings {
        int64_t min_ms = 1000;
        int64_t max_ms = 5000;
        int64_t ideal_pad_ms = 4000;
        int64_t fade_ms = 10;
        int64_t gap_ms = 100;
    };

    explicit ChunkAssembler(const Settings& settings);

    std::vector<AudioBuffer> assemble(const std::vector<AudioBuffer>& segments) const;

    /**
     * @brief a + silence(gap_ms) + b, with a faded out and b faded in.
     */
    AudioBuffer fade_merge(const AudioBuffer& a, const AudioBuffer& b) const;

    /**
     * @brief Pads to ideal_pad_ms if shorter than min_ms, else returns as is.
     */
    AudioBuffer finalize(const AudioBuffer& buffer) const;

    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
};

} // namespace wavchunk

#endif // WAVCHUNK_CHUNK_ASSEMBLER_HPP
