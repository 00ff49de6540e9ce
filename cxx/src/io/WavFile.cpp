/**
 * @file WavFile.cpp
 * @brief libsndfile implementation of WavFile.
 */

#include "WavFile.hpp"
#include "Logger.hpp"
#include <sndfile.h>
#include <utility>
#include <vector>

namespace wavchunk {

namespace {

SampleFormat from_sndfile_subtype(int format) {
    switch (format & SF_FORMAT_SUBMASK) {
        case SF_FORMAT_PCM_U8:
        case SF_FORMAT_PCM_S8:
            return SampleFormat::Pcm8;
        case SF_FORMAT_PCM_24:
            return SampleFormat::Pcm24;
        case SF_FORMAT_PCM_32:
            return SampleFormat::Pcm32;
        case SF_FORMAT_FLOAT:
            return SampleFormat::Float;
        case SF_FORMAT_DOUBLE:
            return SampleFormat::Double;
        case SF_FORMAT_ULAW:
            return SampleFormat::Ulaw;
        case SF_FORMAT_ALAW:
            return SampleFormat::Alaw;
        default:
            // ADPCM and other compressed WAV subtypes are written back as 16-bit PCM
            return SampleFormat::Pcm16;
    }
}

int to_sndfile_subtype(SampleFormat format) {
    switch (format) {
        case SampleFormat::Pcm8: return SF_FORMAT_PCM_U8;
        case SampleFormat::Pcm24: return SF_FORMAT_PCM_24;
        case SampleFormat::Pcm32: return SF_FORMAT_PCM_32;
        case SampleFormat::Float: return SF_FORMAT_FLOAT;
        case SampleFormat::Double: return SF_FORMAT_DOUBLE;
        case SampleFormat::Ulaw: return SF_FORMAT_ULAW;
        case SampleFormat::Alaw: return SF_FORMAT_ALAW;
        case SampleFormat::Pcm16: break;
    }
    return SF_FORMAT_PCM_16;
}

void report(std::string* error, const std::string& message) {
    ChunkLogger::instance().error("WavFile", message);
    if (error) *error = message;
}

} // namespace

bool WavFile::load(const std::string& path, AudioBuffer& out, SampleFormat* format, std::string* error) {
    SF_INFO info{};
    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &info);
    if (!file) {
        report(error, "Cannot open " + path + " (" + sf_strerror(nullptr) + ")");
        return false;
    }

    if (info.channels <= 0 || info.samplerate <= 0 || info.frames < 0) {
        sf_close(file);
        report(error, "Invalid stream parameters in " + path);
        return false;
    }

    std::vector<float> samples(static_cast<size_t>(info.frames) * static_cast<size_t>(info.channels));
    const sf_count_t read = sf_readf_float(file, samples.data(), info.frames);
    if (read != info.frames) {
        const std::string reason = sf_strerror(file);
        sf_close(file);
        report(error, "Short read from " + path + " (" + reason + ")");
        return false;
    }

    if (sf_close(file) != 0) {
        report(error, "Failed to close " + path);
        return false;
    }

    if (format) *format = from_sndfile_subtype(info.format);
    out = AudioBuffer(std::move(samples), info.samplerate, info.channels);
    return true;
}

bool WavFile::save(const std::string& path, const AudioBuffer& buffer, SampleFormat format, std::string* error) {
    SF_INFO info{};
    info.samplerate = buffer.sample_rate();
    info.channels = buffer.channels();
    info.format = SF_FORMAT_WAV | to_sndfile_subtype(format);

    if (!sf_format_check(&info)) {
        report(error, "Unsupported output format for " + path);
        return false;
    }

    SNDFILE* file = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!file) {
        report(error, "Cannot create " + path + " (" + sf_strerror(nullptr) + ")");
        return false;
    }

    // Clip rather than wrap samples beyond full scale
    sf_command(file, SFC_SET_CLIPPING, nullptr, SF_TRUE);

    const auto samples = buffer.samples();
    const sf_count_t frames = static_cast<sf_count_t>(buffer.frames());
    const sf_count_t written = sf_writef_float(file, samples.data(), frames);
    if (written != frames) {
        const std::string reason = sf_strerror(file);
        sf_close(file);
        report(error, "Short write to " + path + " (" + reason + ")");
        return false;
    }

    if (sf_close(file) != 0) {
        report(error, "Failed to finalize " + path);
        return false;
    }
    return true;
}

} // namespace wavchunk
