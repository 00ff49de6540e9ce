/**
 * @file AudioBuffer.cpp
 * @brief Implementation of AudioBuffer slicing, fades and level queries.
 */

#include "AudioBuffer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace wavchunk {

AudioBuffer::AudioBuffer(int sample_rate, int channels)
    : sample_rate_(sample_rate)
    , channels_(channels)
{
}

AudioBuffer::AudioBuffer(std::vector<float> samples, int sample_rate, int channels)
    : samples_(std::move(samples))
    , sample_rate_(sample_rate)
    , channels_(channels)
{
    // Drop a trailing partial frame
    if (channels_ > 0) {
        samples_.resize(frames() * static_cast<size_t>(channels_));
    }
}

AudioBuffer AudioBuffer::silent(int64_t duration_ms, int sample_rate, int channels) {
    AudioBuffer buffer(sample_rate, channels);
    if (duration_ms > 0 && channels > 0) {
        buffer.samples_.assign(buffer.ms_to_frames(duration_ms) * static_cast<size_t>(channels), 0.0f);
    }
    return buffer;
}

AudioBuffer AudioBuffer::concat(const AudioBuffer& a, const AudioBuffer& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    if (a.sample_rate_ != b.sample_rate_ || a.channels_ != b.channels_) {
        throw std::invalid_argument("AudioBuffer::concat: sample format mismatch");
    }

    AudioBuffer joined(a.sample_rate_, a.channels_);
    joined.samples_.reserve(a.samples_.size() + b.samples_.size());
    joined.samples_.insert(joined.samples_.end(), a.samples_.begin(), a.samples_.end());
    joined.samples_.insert(joined.samples_.end(), b.samples_.begin(), b.samples_.end());
    return joined;
}

int64_t AudioBuffer::duration_ms() const {
    if (sample_rate_ <= 0) return 0;
    return std::llround(static_cast<double>(frames()) * 1000.0 / static_cast<double>(sample_rate_));
}

size_t AudioBuffer::ms_to_frames(int64_t ms) const {
    if (ms <= 0 || sample_rate_ <= 0) return 0;
    return static_cast<size_t>(ms * static_cast<int64_t>(sample_rate_) / 1000);
}

AudioBuffer AudioBuffer::slice(int64_t start_ms, int64_t end_ms) const {
    const int64_t length = duration_ms();
    start_ms = std::clamp<int64_t>(start_ms, 0, length);
    end_ms = std::clamp<int64_t>(end_ms, 0, length);
    return slice_frames(ms_to_frames(start_ms), ms_to_frames(end_ms));
}

AudioBuffer AudioBuffer::slice_frames(size_t start_frame, size_t end_frame) const {
    AudioBuffer part(sample_rate_, channels_);
    const size_t total = frames();
    start_frame = std::min(start_frame, total);
    end_frame = std::min(end_frame, total);
    if (end_frame <= start_frame) {
        return part;
    }

    const size_t ch = static_cast<size_t>(channels_);
    part.samples_.assign(samples_.begin() + static_cast<std::ptrdiff_t>(start_frame * ch),
                         samples_.begin() + static_cast<std::ptrdiff_t>(end_frame * ch));
    return part;
}

AudioBuffer AudioBuffer::fade_in(int64_t duration_ms) const {
    AudioBuffer out = *this;
    const size_t fade_frames = std::min(ms_to_frames(duration_ms), frames());
    if (fade_frames == 0) return out;

    const size_t ch = static_cast<size_t>(channels_);
    for (size_t i = 0; i < fade_frames; ++i) {
        const float gain = static_cast<float>(i) / static_cast<float>(fade_frames);
        for (size_t c = 0; c < ch; ++c) {
            out.samples_[i * ch + c] *= gain;
        }
    }
    return out;
}

AudioBuffer AudioBuffer::fade_out(int64_t duration_ms) const {
    AudioBuffer out = *this;
    const size_t total = frames();
    const size_t fade_frames = std::min(ms_to_frames(duration_ms), total);
    if (fade_frames == 0) return out;

    const size_t ch = static_cast<size_t>(channels_);
    const size_t first = total - fade_frames;
    for (size_t i = 0; i < fade_frames; ++i) {
        const float gain = 1.0f - static_cast<float>(i) / static_cast<float>(fade_frames);
        for (size_t c = 0; c < ch; ++c) {
            out.samples_[(first + i) * ch + c] *= gain;
        }
    }
    return out;
}

AudioBuffer AudioBuffer::append_silence(int64_t duration_ms) const {
    AudioBuffer out = *this;
    const size_t extra = ms_to_frames(duration_ms) * static_cast<size_t>(channels_);
    out.samples_.resize(out.samples_.size() + extra, 0.0f);
    return out;
}

AudioBuffer AudioBuffer::pad_to(int64_t target_ms) const {
    AudioBuffer out = *this;
    const size_t target_frames = ms_to_frames(target_ms);
    if (target_frames > frames()) {
        out.samples_.resize(target_frames * static_cast<size_t>(channels_), 0.0f);
    }
    return out;
}

float AudioBuffer::rms() const {
    if (samples_.empty()) return 0.0f;

    double sum_sq = 0.0;
    for (float s : samples_) {
        sum_sq += static_cast<double>(s) * static_cast<double>(s);
    }
    return static_cast<float>(std::sqrt(sum_sq / static_cast<double>(samples_.size())));
}

float AudioBuffer::rms(int64_t start_ms, int64_t end_ms) const {
    return slice(start_ms, end_ms).rms();
}

float AudioBuffer::db_to_amplitude(double db) {
    return static_cast<float>(std::pow(10.0, db / 20.0));
}

double AudioBuffer::amplitude_to_db(float amplitude) {
    if (amplitude <= 0.0f) {
        return -std::numeric_limits<double>::infinity();
    }
    return 20.0 * std::log10(static_cast<double>(amplitude));
}

} // namespace wavchunk
