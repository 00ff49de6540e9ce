/**
 * @file ChunkerConfig.hpp
 * @brief Immutable parameter set for one segmentation run.
 */

#ifndef WAVCHUNK_CHUNKER_CONFIG_HPP
#define WAVCHUNK_CHUNKER_CONFIG_HPP

#include <cmath>
#include <cstdint>
#include <string>

namespace wavchunk {

/**
 * @brief Every option recognized by the chunker, with its default.
 *
 * Built once (defaults, then JSON file, then command-line flags) and
 * passed by const reference to every file worker.
 */
struct ChunkerConfig {
    static constexpr double kDefaultSilenceThresh = -40.0;
    static constexpr double kInteractiveSilenceThresh = -60.0;

    int version = 1;

    // Silence segmentation
    int min_silence_len = 300;                       // ms
    double silence_thresh = kDefaultSilenceThresh;   // dBFS

    // Chunk duration window
    double min_sec = 1.0;
    double max_sec = 5.0;
    double ideal_pad_sec = 4.0;

    // Boundary smoothing
    int fade_ms = 10;
    int gap_ms = 100;

    // Quiet-point search
    int search_range_ms = 1000;
    int search_step_ms = 50;

    // Batch
    int workers = 0;    // 0 = one per hardware thread
    std::string output_dir;

    int64_t min_ms() const { return std::llround(min_sec * 1000.0); }
    int64_t max_ms() const { return std::llround(max_sec * 1000.0); }
    int64_t ideal_pad_ms() const { return std::llround(ideal_pad_sec * 1000.0); }

    /**
     * @brief Check ranges and cross-field constraints.
     *
     * @param reason Receives a description of the first violation.
     * @return true if the configuration can be used.
     */
    bool validate(std::string& reason) const;
};

/**
 * @brief Parse a whole option value, rejecting trailing text and values
 *        outside the target type's range. out is untouched on failure.
 */
bool parse_value(const std::string& text, int& out);
bool parse_value(const std::string& text, double& out);

} // namespace wavchunk

#endif // WAVCHUNK_CHUNKER_CONFIG_HPP
