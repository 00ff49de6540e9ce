#include "ConfigStore.hpp"
#include "Logger.hpp"
#include <fstream>
#include <iterator>

namespace wavchunk {

bool ConfigStore::deserialize(ChunkerConfig& config, const std::string& data, std::string* error) {
    try {
        json j = json::parse(data);
        if (!j.is_object()) {
            if (error) *error = "top-level JSON value is not an object";
            return false;
        }

        // from_json of the WITH_DEFAULT macro starts from a default-constructed
        // value, so overlay onto a copy of the caller's config instead.
        json merged = config;
        merged.update(j);
        ChunkerConfig parsed = merged.get<ChunkerConfig>();
        config = parsed;
        return true;
    } catch (const json::exception& e) {
        if (error) *error = e.what();
        return false;
    }
}

bool ConfigStore::save_to_file(const ChunkerConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        ChunkLogger::instance().error("ConfigStore", "Failed to open file for writing: " + path);
        return false;
    }
    file << serialize(config) << '\n';
    if (!file.good()) {
        ChunkLogger::instance().error("ConfigStore", "Failed to write: " + path);
        return false;
    }
    return true;
}

bool ConfigStore::load_from_file(ChunkerConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        ChunkLogger::instance().error("ConfigStore", "Failed to open file: " + path);
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    std::string error;
    if (!deserialize(config, content, &error)) {
        ChunkLogger::instance().error("ConfigStore", "Failed to parse " + path + ": " + error);
        return false;
    }

    ChunkLogger::instance().info("ConfigStore", "Loaded configuration: " + path);
    return true;
}

} // namespace wavchunk
