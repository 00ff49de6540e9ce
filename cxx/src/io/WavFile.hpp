/**
 * @file WavFile.hpp
 * @brief PCM WAV read/write on top of libsndfile.
 *
 * File formats stay out of the DSP code: everything under dsp/ sees only
 * AudioBuffer.
 */

#ifndef WAVCHUNK_WAV_FILE_HPP
#define WAVCHUNK_WAV_FILE_HPP

#include "AudioBuffer.hpp"
#include <string>

namespace wavchunk {

/**
 * @brief Sample encoding of a WAV file.
 */
enum class SampleFormat {
    Pcm8,       // Unsigned 8-bit in WAV
    Pcm16,
    Pcm24,
    Pcm32,
    Float,
    Double,
    Ulaw,
    Alaw
};

class WavFile {
public:
    /**
     * @brief Decode a file into interleaved float samples.
     *
     * @param path Input path
     * @param out Receives the samples, sample rate and channel count
     * @param format Optional, receives the input encoding
     * @param error Optional, receives the failure reason
     * @return false if the file cannot be opened or decoded
     */
    static bool load(const std::string& path, AudioBuffer& out,
                     SampleFormat* format = nullptr, std::string* error = nullptr);

    static bool save(const std::string& path, const AudioBuffer& buffer,
                     SampleFormat format = SampleFormat::Pcm16, std::string* error = nullptr);
};

} // namespace wavchunk

#endif // WAVCHUNK_WAV_FILE_HPP
