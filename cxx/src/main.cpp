/**
 * @file main.cpp
 * @brief Command-line entry point for wavchunk.
 *
 * Exit codes: 0 all files ok or empty, 1 bad arguments or configuration,
 * 2 at least one file failed.
 */

#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include "BatchRunner.hpp"
#include "ChunkerConfig.hpp"
#include "ConfigStore.hpp"
#include "InteractivePrompt.hpp"
#include "Logger.hpp"

using namespace wavchunk;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --input_dir <dir> --output_dir <dir> [options]\n"
              << "       " << program << " --output_dir <dir> [options] <file.wav>...\n"
              << "       " << program << " --interactive\n"
              << "\n"
              << "Cuts recordings on silence, splits phrases longer than max_sec at quiet\n"
              << "points, and merges or pads short pieces into <name>_partNNN.wav chunks.\n"
              << "\n"
              << "Options:\n"
              << "  --input_dir <dir>         Directory of .wav files to process\n"
              << "  --output_dir <dir>        Directory for chunk files (created if missing)\n"
              << "  --min_silence_len <ms>    Shortest silence that splits phrases (default 300)\n"
              << "  --silence_thresh <dBFS>   Level at or below which audio is silent (default -40)\n"
              << "  --min_sec <s>             Chunks shorter than this are padded (default 1)\n"
              << "  --max_sec <s>             Longest chunk before splitting (default 5)\n"
              << "  --fade_ms <ms>            Fade at every cut and merge (default 10)\n"
              << "  --gap_ms <ms>             Silence between merged segments (default 100)\n"
              << "  --workers <n>             Parallel files, 0 = one per CPU (default 0)\n"
              << "  --config <file.json>      Load options from JSON; later flags override\n"
              << "  --save-config <file.json> Write the effective options as JSON and exit\n"
              << "  --interactive             Ask for every option (silence_thresh default -60)\n"
              << "  --quiet                   Only print warnings and errors\n"
              << "  --help                    Print this help message\n";
}

} // namespace

int main(int argc, char** argv) {
    auto& logger = ChunkLogger::instance();

    bool interactive = false;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--interactive") == 0) {
            interactive = true;
        }
    }

    // Interactive defaults sit below the config file and flags
    ChunkerConfig config = interactive ? InteractivePrompt::defaults() : ChunkerConfig{};
    std::string input_dir;
    std::string save_config_path;
    std::vector<std::string> files;

    // Config file first so that flags given anywhere on the line override it
    for (int i = 1; i + 1 < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (!ConfigStore::load_from_file(config, argv[i + 1])) {
                return 1;
            }
        }
    }

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        bool ok = true;

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--interactive") {
            // Already applied above
        } else if (arg == "--quiet") {
            logger.set_quiet(true);
        } else if (arg == "--config" && has_value) {
            ++i;
        } else if (arg == "--save-config" && has_value) {
            save_config_path = argv[++i];
        } else if (arg == "--input_dir" && has_value) {
            input_dir = argv[++i];
        } else if (arg == "--output_dir" && has_value) {
            config.output_dir = argv[++i];
        } else if (arg == "--min_silence_len" && has_value) {
            ok = parse_value(argv[++i], config.min_silence_len);
        } else if (arg == "--silence_thresh" && has_value) {
            ok = parse_value(argv[++i], config.silence_thresh);
        } else if (arg == "--min_sec" && has_value) {
            ok = parse_value(argv[++i], config.min_sec);
        } else if (arg == "--max_sec" && has_value) {
            ok = parse_value(argv[++i], config.max_sec);
        } else if (arg == "--fade_ms" && has_value) {
            ok = parse_value(argv[++i], config.fade_ms);
        } else if (arg == "--gap_ms" && has_value) {
            ok = parse_value(argv[++i], config.gap_ms);
        } else if (arg == "--workers" && has_value) {
            ok = parse_value(argv[++i], config.workers);
        } else if (!arg.empty() && arg[0] != '-') {
            files.push_back(arg);
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n\n";
            print_usage(argv[0]);
            return 1;
        }

        if (!ok) {
            std::cerr << "Error: invalid value '" << argv[i] << "' for " << arg << "\n";
            return 1;
        }
    }

    if (interactive) {
        InteractivePrompt prompt(std::cin, std::cout);
        if (!prompt.run(config, input_dir)) {
            std::cerr << "Error: input ended before all options were answered\n";
            return 1;
        }
    }

    std::string reason;
    if (!config.validate(reason)) {
        std::cerr << "Error: " << reason << "\n";
        return 1;
    }

    if (!save_config_path.empty()) {
        return ConfigStore::save_to_file(config, save_config_path) ? 0 : 1;
    }

    if (config.output_dir.empty() || (input_dir.empty() && files.empty())) {
        std::cerr << "Error: an output directory and at least one input are required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (!input_dir.empty()) {
        auto listed = BatchRunner::list_wav_files(input_dir);
        if (listed.empty()) {
            logger.warn("Batch", "No .wav files found in " + input_dir);
        }
        files.insert(files.end(), listed.begin(), listed.end());
    }

    const BatchRunner runner(config);
    const auto reports = runner.run(files);
    for (const auto& report : reports) {
        if (report.failed()) {
            logger.error("Batch", report.input_path + ": " + to_string(report.status) +
                                  (report.error.empty() ? "" : " (" + report.error + ")"));
        }
    }

    const BatchSummary summary = BatchRunner::summarize(reports);
    logger.info("Batch", std::to_string(summary.files) + " file(s), " +
                         std::to_string(summary.chunks) + " chunk(s) written, " +
                         std::to_string(summary.empty) + " empty, " +
                         std::to_string(summary.failed) + " failed");

    return summary.failed > 0 ? 2 : 0;
}
