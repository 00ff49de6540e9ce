/**
 * @file BatchRunner.hpp
 * @brief Runs the per-file pipeline over many files on a worker pool.
 */

#ifndef WAVCHUNK_BATCH_RUNNER_HPP
#define WAVCHUNK_BATCH_RUNNER_HPP

#include "ChunkPipeline.hpp"
#include "ChunkerConfig.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace wavchunk {

/**
 * @brief Totals over a finished batch.
 */
struct BatchSummary {
    size_t files = 0;
    size_t chunks = 0;
    size_t empty = 0;
    size_t failed = 0;
};

/**
 * @brief Fixed-size pool of std::thread workers over independent files.
 *
 * Workers claim the next file index from an atomic counter. Files share
 * nothing but the const configuration, so no other synchronization is
 * needed. One failing file does not affect the others.
 */
class BatchRunner {
public:
    explicit BatchRunner(const ChunkerConfig& config);

    /**
     * @brief Process files into config.output_dir.
     *
     * @return One report per input, in input order.
     */
    std::vector<FileReport> run(const std::vector<std::string>& files) const;

    /**
     * @brief Sorted paths of the *.wav files (any case) directly inside dir.
     */
    static std::vector<std::string> list_wav_files(const std::string& dir);

    static BatchSummary summarize(const std::vector<FileReport>& reports);

    /**
     * @brief Threads used for a batch of file_count files.
     */
    size_t worker_count(size_t file_count) const;

private:
    ChunkerConfig config_;
};

} // namespace wavchunk

#endif // WAVCHUNK_BATCH_RUNNER_HPP
