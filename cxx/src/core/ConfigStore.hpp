/**
 * @file ConfigStore.hpp
 * @brief Human-readable JSON persistence for ChunkerConfig.
 */

#ifndef WAVCHUNK_CONFIG_STORE_HPP
#define WAVCHUNK_CONFIG_STORE_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "ChunkerConfig.hpp"

namespace wavchunk {

using json = nlohmann::json;

// Missing keys keep the value already present in the target struct.
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ChunkerConfig,
    version, min_silence_len, silence_thresh,
    min_sec, max_sec, ideal_pad_sec,
    fade_ms, gap_ms,
    search_range_ms, search_step_ms,
    workers, output_dir)

/**
 * @brief Saves and loads ChunkerConfig as JSON.
 */
class ConfigStore {
public:
    static bool save_to_file(const ChunkerConfig& config, const std::string& path);

    /**
     * @brief Overlay the keys found in a JSON file onto config.
     *
     * config is left untouched when the file cannot be read or parsed.
     */
    static bool load_from_file(ChunkerConfig& config, const std::string& path);

    static std::string serialize(const ChunkerConfig& config) {
        json j = config;
        return j.dump(4);
    }

    static bool deserialize(ChunkerConfig& config, const std::string& data, std::string* error = nullptr);
};

} // namespace wavchunk

#endif // WAVCHUNK_CONFIG_STORE_HPP
