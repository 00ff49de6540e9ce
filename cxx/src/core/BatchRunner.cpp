#include "BatchRunner.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <thread>

namespace wavchunk {

namespace fs = std::filesystem;

BatchRunner::BatchRunner(const ChunkerConfig& config)
    : config_(config)
{
}

size_t BatchRunner::worker_count(size_t file_count) const {
    size_t workers = config_.workers > 0
        ? static_cast<size_t>(config_.workers)
        : static_cast<size_t>(std::thread::hardware_concurrency());
    workers = std::max<size_t>(1, workers);
    return std::min(workers, std::max<size_t>(1, file_count));
}

std::vector<FileReport> BatchRunner::run(const std::vector<std::string>& files) const {
    std::vector<FileReport> reports(files.size());
    if (files.empty()) {
        return reports;
    }

    const ChunkPipeline pipeline(config_);
    std::atomic<size_t> next_index{0};

    auto worker_loop = [&]() {
        while (true) {
            const size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
            if (index >= files.size()) {
                break;
            }
            reports[index] = pipeline.process_file(files[index], config_.output_dir);
        }
    };

    const size_t workers = worker_count(files.size());
    ChunkLogger::instance().info("Batch",
        "Processing " + std::to_string(files.size()) + " file(s) with " +
        std::to_string(workers) + " worker(s)");

    if (workers == 1) {
        worker_loop();
        return reports;
    }

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker_loop);
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return reports;
}

std::vector<std::string> BatchRunner::list_wav_files(const std::string& dir) {
    std::vector<std::string> files;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        ChunkLogger::instance().error("Batch", "Cannot list " + dir + " (" + ec.message() + ")");
        return files;
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        std::string ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == ".wav") {
            files.push_back(entry.path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

BatchSummary BatchRunner::summarize(const std::vector<FileReport>& reports) {
    BatchSummary summary;
    summary.files = reports.size();
    for (const auto& report : reports) {
        summary.chunks += report.outputs.size();
        if (report.status == FileReport::Status::Empty) {
            summary.empty++;
        } else if (report.failed()) {
            summary.failed++;
        }
    }
    return summary;
}

} // namespace wavchunk
