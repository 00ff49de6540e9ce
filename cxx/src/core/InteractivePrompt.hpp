/**
 * @file InteractivePrompt.hpp
 * @brief Collects run parameters by asking on a text stream.
 */

#ifndef WAVCHUNK_INTERACTIVE_PROMPT_HPP
#define WAVCHUNK_INTERACTIVE_PROMPT_HPP

#include "ChunkerConfig.hpp"
#include <istream>
#include <ostream>
#include <string>

namespace wavchunk {

/**
 * @brief Question/answer front end used by `wavchunk --interactive`.
 *
 * Each question shows the current value; an empty answer keeps it.
 */
class InteractivePrompt {
public:
    InteractivePrompt(std::istream& in, std::ostream& out);

    /**
     * @brief Starting values for this mode: the built-in defaults with the
     *        silence threshold lowered to -60 dBFS.
     *
     * A config file and flags are applied on top before run() asks.
     */
    static ChunkerConfig defaults();

    /**
     * @return false on end of input before all questions were answered.
     */
    bool run(ChunkerConfig& config, std::string& input_dir);

private:
    bool ask_text(const std::string& label, std::string& value, bool required);

    template<typename T>
    bool ask_number(const std::string& label, T& value);

    std::istream& in_;
    std::ostream& out_;
};

} // namespace wavchunk

#endif // WAVCHUNK_INTERACTIVE_PROMPT_HPP
