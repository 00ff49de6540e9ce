/**
 * @file AudioBuffer.hpp
 * @brief Owning, interleaved multi-channel audio buffer with millisecond addressing.
 */

#ifndef WAVCHUNK_AUDIO_BUFFER_HPP
#define WAVCHUNK_AUDIO_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace wavchunk {

/**
 * @brief A block of interleaved float samples in [-1, 1] plus its format.
 *
 * Buffers are treated as immutable values: every editing operation
 * (slice, fade, concatenation, padding) returns a new buffer and leaves
 * the source untouched, so pipeline stages never share mutable state.
 *
 * Millisecond positions follow one convention throughout:
 * - duration_ms() is round(frames * 1000 / sample_rate)
 * - a millisecond offset maps to frame floor(ms * sample_rate / 1000)
 */
class AudioBuffer {
public:
    AudioBuffer() = default;
    AudioBuffer(int sample_rate, int channels);
    AudioBuffer(std::vector<float> samples, int sample_rate, int channels);

    /**
     * @brief Create a buffer of digital silence.
     */
    static AudioBuffer silent(int64_t duration_ms, int sample_rate, int channels);

    /**
     * @brief Join two buffers back to back.
     *
     * An empty operand yields the other one. Non-empty operands must share
     * sample rate and channel count (std::invalid_argument otherwise).
     */
    static AudioBuffer concat(const AudioBuffer& a, const AudioBuffer& b);

    int sample_rate() const { return sample_rate_; }
    int channels() const { return channels_; }
    size_t frames() const { return channels_ > 0 ? samples_.size() / static_cast<size_t>(channels_) : 0; }
    bool empty() const { return samples_.empty(); }
    std::span<const float> samples() const { return samples_; }

    int64_t duration_ms() const;
    size_t ms_to_frames(int64_t ms) const;

    /**
     * @brief Copy of the [start_ms, end_ms) range, clamped to the buffer.
     */
    AudioBuffer slice(int64_t start_ms, int64_t end_ms) const;
    AudioBuffer slice_frames(size_t start_frame, size_t end_frame) const;

    /**
     * @brief Linear gain ramp 0 -> 1 over the first duration_ms.
     */
    AudioBuffer fade_in(int64_t duration_ms) const;

    /**
     * @brief Linear gain ramp 1 -> 0 over the last duration_ms.
     */
    AudioBuffer fade_out(int64_t duration_ms) const;

    AudioBuffer append_silence(int64_t duration_ms) const;

    /**
     * @brief Pad with trailing silence up to target_ms. Never truncates.
     */
    AudioBuffer pad_to(int64_t target_ms) const;

    /**
     * @brief RMS over every sample of every channel. 0 for an empty buffer.
     */
    float rms() const;
    float rms(int64_t start_ms, int64_t end_ms) const;

    static float db_to_amplitude(double db);
    static double amplitude_to_db(float amplitude);

private:
    std::vector<float> samples_;
    int sample_rate_ = 0;
    int channels_ = 0;
};

} // namespace wavchunk

#endif // WAVCHUNK_AUDIO_BUFFER_HPP
