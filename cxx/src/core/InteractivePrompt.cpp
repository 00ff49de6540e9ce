#include "InteractivePrompt.hpp"
#include <sstream>

namespace wavchunk {

InteractivePrompt::InteractivePrompt(std::istream& in, std::ostream& out)
    : in_(in)
    , out_(out)
{
}

bool InteractivePrompt::ask_text(const std::string& label, std::string& value, bool required) {
    while (true) {
        out_ << label;
        if (!value.empty()) {
            out_ << " [" << value << "]";
        }
        out_ << ": " << std::flush;

        std::string line;
        if (!std::getline(in_, line)) {
            return false;
        }
        if (!line.empty()) {
            value = line;
        }
        if (!required || !value.empty()) {
            return true;
        }
        out_ << "  A value is required." << std::endl;
    }
}

template<typename T>
bool InteractivePrompt::ask_number(const std::string& label, T& value) {
    while (true) {
        out_ << label << " [" << value << "]: " << std::flush;

        std::string line;
        if (!std::getline(in_, line)) {
            return false;
        }
        if (line.empty()) {
            return true;
        }

        std::istringstream parser(line);
        T parsed{};
        if ((parser >> parsed) && (parser >> std::ws).eof()) {
            value = parsed;
            return true;
        }
        out_ << "  Not a number: " << line << std::endl;
    }
}

ChunkerConfig InteractivePrompt::defaults() {
    ChunkerConfig config;
    config.silence_thresh = ChunkerConfig::kInteractiveSilenceThresh;
    return config;
}

bool InteractivePrompt::run(ChunkerConfig& config, std::string& input_dir) {
    return ask_text("Input directory", input_dir, true)
        && ask_text("Output directory", config.output_dir, true)
        && ask_number("Minimum silence length (ms)", config.min_silence_len)
        && ask_number("Silence threshold (dBFS)", config.silence_thresh)
        && ask_number("Minimum chunk length (s)", config.min_sec)
        && ask_number("Maximum chunk length (s)", config.max_sec)
        && ask_number("Fade length (ms)", config.fade_ms)
        && ask_number("Gap between merged segments (ms)", config.gap_ms)
        && ask_number("Workers (0 = auto)", config.workers);
}

} // namespace wavchunk
