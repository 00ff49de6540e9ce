/**
 * @file ChunkPipeline.hpp
 * @brief Per-file entry points: segment, split, assemble, export.
 */

#ifndef WAVCHUNK_CHUNK_PIPELINE_HPP
#define WAVCHUNK_CHUNK_PIPELINE_HPP

#include "AudioBuffer.hpp"
#include "ChunkerConfig.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace wavchunk {

/**
 * @brief Outcome of processing one input file.
 */
struct FileReport {
    enum class Status {
        Ok,                 // At least one chunk written
        Empty,              // No audio left after silence removal, nothing written
        InvalidAudioInput,  // Input could not be decoded
        WriteFailed         // A chunk could not be written
    };

    std::string input_path;
    Status status = Status::Ok;
    std::string error;
    std::vector<std::string> outputs;
    std::vector<int64_t> durations_ms;

    bool failed() const {
        return status == Status::InvalidAudioInput || status == Status::WriteFailed;
    }
};

const char* to_string(FileReport::Status status);

/**
 * @brief Intermediate results of one run, kept for inspection.
 */
struct PipelineTrace {
    std::vector<AudioBuffer> phrases;
    std::vector<AudioBuffer> segments;
    std::vector<AudioBuffer> chunks;
};

class ChunkPipeline {
public:
    explicit ChunkPipeline(const ChunkerConfig& config);

    /**
     * @brief Pure in-memory run over one recording.
     *
     * Silence segmentation, quiet-point splitting of phrases longer than
     * max_sec, then merge-or-pad assembly. An empty or all-silent input
     * yields no chunks.
     */
    std::vector<AudioBuffer> process(const AudioBuffer& audio) const;
    PipelineTrace trace(const AudioBuffer& audio) const;

    /**
     * @brief Load, process and write <base>_partNNN.wav files to output_dir.
     *
     * Never throws. Failures are reported in the returned FileReport.
     */
    FileReport process_file(const std::string& input_path, const std::string& output_dir) const;

    /**
     * @brief "<base>_partNNN.wav", index is 1-based and zero-padded to 3 digits.
     */
    static std::string chunk_file_name(const std::string& base_name, size_t index);

    const ChunkerConfig& config() const { return config_; }

private:
    void export_file(const std::string& input_path, const std::string& output_dir,
                     FileReport& report, FileReport::Status& stage) const;

    ChunkerConfig config_;
};

} // namespace wavchunk

#endif // WAVCHUNK_CHUNK_PIPELINE_HPP
