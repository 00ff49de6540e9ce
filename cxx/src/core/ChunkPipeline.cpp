#include "ChunkPipeline.hpp"
#include "SilenceSegmenter.hpp"
#include "QuietPointSplitter.hpp"
#include "ChunkAssembler.hpp"
#include "WavFile.hpp"
#include "Logger.hpp"
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iterator>
#include <system_error>

namespace wavchunk {

namespace fs = std::filesystem;

const char* to_string(FileReport::Status status) {
    switch (status) {
        case FileReport::Status::Ok: return "ok";
        case FileReport::Status::Empty: return "empty";
        case FileReport::Status::InvalidAudioInput: return "invalid audio input";
        case FileReport::Status::WriteFailed: return "write failed";
    }
    return "unknown";
}

ChunkPipeline::ChunkPipeline(const ChunkerConfig& config)
    : config_(config)
{
}

PipelineTrace ChunkPipeline::trace(const AudioBuffer& audio) const {
    PipelineTrace t;

    // 1. Phrases between silences
    const SilenceSegmenter segmenter(config_.min_silence_len, config_.silence_thresh);
    t.phrases = segmenter.split(audio);

    // 2. Oversized phrases cut at quiet points
    QuietPointSplitter::Settings split_settings;
    split_settings.max_len_ms = config_.max_ms();
    split_settings.fade_ms = config_.fade_ms;
    split_settings.search_range_ms = config_.search_range_ms;
    split_settings.search_step_ms = config_.search_step_ms;
    const QuietPointSplitter splitter(split_settings);

    for (const auto& phrase : t.phrases) {
        if (phrase.duration_ms() > split_settings.max_len_ms) {
            auto parts = splitter.split(phrase);
            t.segments.insert(t.segments.end(),
                              std::make_move_iterator(parts.begin()),
                              std::make_move_iterator(parts.end()));
        } else {
            t.segments.push_back(phrase);
        }
    }

    // 3. Short segments merged or padded
    ChunkAssembler::Settings assembly;
    assembly.min_ms = config_.min_ms();
    assembly.max_ms = config_.max_ms();
    assembly.ideal_pad_ms = config_.ideal_pad_ms();
    assembly.fade_ms = config_.fade_ms;
    assembly.gap_ms = config_.gap_ms;
    t.chunks = ChunkAssembler(assembly).assemble(t.segments);

    return t;
}

std::vector<AudioBuffer> ChunkPipeline::process(const AudioBuffer& audio) const {
    return trace(audio).chunks;
}

std::string ChunkPipeline::chunk_file_name(const std::string& base_name, size_t index) {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), "_part%03zu.wav", index);
    return base_name + suffix;
}

FileReport ChunkPipeline::process_file(const std::string& input_path, const std::string& output_dir) const {
    FileReport report;
    report.input_path = input_path;

    // Status to report if an exception escapes the current stage
    FileReport::Status stage = FileReport::Status::InvalidAudioInput;
    try {
        export_file(input_path, output_dir, report, stage);
    } catch (const std::exception& e) {
        report.status = stage;
        report.error = e.what();
        ChunkLogger::instance().error("Pipeline", input_path + ": " + report.error);
    }
    return report;
}

void ChunkPipeline::export_file(const std::string& input_path, const std::string& output_dir,
                                FileReport& report, FileReport::Status& stage) const {
    auto& logger = ChunkLogger::instance();

    AudioBuffer audio;
    SampleFormat format = SampleFormat::Pcm16;
    std::string error;
    if (!WavFile::load(input_path, audio, &format, &error)) {
        report.status = FileReport::Status::InvalidAudioInput;
        report.error = error;
        return;
    }

    const std::vector<AudioBuffer> chunks = process(audio);
    if (chunks.empty()) {
        report.status = FileReport::Status::Empty;
        logger.warn("Pipeline", "No audio above the silence threshold: " + input_path);
        return;
    }

    stage = FileReport::Status::WriteFailed;
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        report.status = FileReport::Status::WriteFailed;
        report.error = "Cannot create output directory " + output_dir + " (" + ec.message() + ")";
        logger.error("Pipeline", report.error);
        return;
    }

    const std::string base = fs::path(input_path).stem().string();
    for (size_t i = 0; i < chunks.size(); ++i) {
        const std::string out_path = (fs::path(output_dir) / chunk_file_name(base, i + 1)).string();
        if (!WavFile::save(out_path, chunks[i], format, &error)) {
            report.status = FileReport::Status::WriteFailed;
            report.error = error;
            return;
        }

        const int64_t length = chunks[i].duration_ms();
        report.outputs.push_back(out_path);
        report.durations_ms.push_back(length);
        logger.log_event("Export",
                         "Exported: " + out_path + " (length=" + std::to_string(length) + " ms)",
                         static_cast<double>(length));
    }

    report.status = FileReport::Status::Ok;
}

} // namespace wavchunk
