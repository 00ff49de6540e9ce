/**
 * @file ChunkerBridge.cpp
 * @brief C-compatible API bridge for the chunking pipeline.
 */

#include "CInterface.h"
#include "AudioBuffer.hpp"
#include "ChunkerConfig.hpp"
#include "ChunkPipeline.hpp"
#include "ConfigStore.hpp"
#include <cmath>
#include <exception>
#include <functional>
#include <limits>
#include <type_traits>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Internal handle structure (hidden from C API)
struct ChunkerHandleImpl {
    wavchunk::ChunkerConfig config;
    std::string last_error;
};

namespace {

// Returns false when value cannot be represented in the field's type
using ParamSetter = std::function<bool(wavchunk::ChunkerConfig&, double)>;
using ParamGetter = std::function<double(const wavchunk::ChunkerConfig&)>;

struct ParamAccess {
    ParamSetter set;
    ParamGetter get;
};

template<typename T>
ParamAccess field(T wavchunk::ChunkerConfig::*member) {
    return ParamAccess{
        [member](wavchunk::ChunkerConfig& c, double v) {
            if (!std::isfinite(v)) return false;
            if constexpr (std::is_integral_v<T>) {
                if (v < static_cast<double>(std::numeric_limits<T>::min()) ||
                    v > static_cast<double>(std::numeric_limits<T>::max())) {
                    return false;
                }
            }
            c.*member = static_cast<T>(v);
            return true;
        },
        [member](const wavchunk::ChunkerConfig& c) { return static_cast<double>(c.*member); }
    };
}

const std::unordered_map<std::string, ParamAccess>& param_table() {
    static const std::unordered_map<std::string, ParamAccess> table = {
        {"min_silence_len", field(&wavchunk::ChunkerConfig::min_silence_len)},
        {"silence_thresh", field(&wavchunk::ChunkerConfig::silence_thresh)},
        {"min_sec", field(&wavchunk::ChunkerConfig::min_sec)},
        {"max_sec", field(&wavchunk::ChunkerConfig::max_sec)},
        {"ideal_pad_sec", field(&wavchunk::ChunkerConfig::ideal_pad_sec)},
        {"fade_ms", field(&wavchunk::ChunkerConfig::fade_ms)},
        {"gap_ms", field(&wavchunk::ChunkerConfig::gap_ms)},
        {"search_range_ms", field(&wavchunk::ChunkerConfig::search_range_ms)},
        {"search_step_ms", field(&wavchunk::ChunkerConfig::search_step_ms)},
        {"workers", field(&wavchunk::ChunkerConfig::workers)},
    };
    return table;
}

ChunkerHandleImpl* as_impl(ChunkerHandle handle) {
    return static_cast<ChunkerHandleImpl*>(handle);
}

bool check_config(ChunkerHandleImpl* impl) {
    std::string reason;
    if (!impl->config.validate(reason)) {
        impl->last_error = "invalid configuration: " + reason;
        return false;
    }
    return true;
}

} // namespace

extern "C" {

ChunkerHandle chunker_create(void) {
    try {
        return static_cast<ChunkerHandle>(new ChunkerHandleImpl());
    } catch (const std::exception&) {
        return nullptr;
    }
}

void chunker_destroy(ChunkerHandle handle) {
    if (handle) {
        delete as_impl(handle);
    }
}

int chunker_set_param(ChunkerHandle handle, const char* name, double value) {
    if (!handle || !name) return -1;
    auto* impl = as_impl(handle);

    const auto& table = param_table();
    auto it = table.find(name);
    if (it == table.end()) {
        impl->last_error = std::string("unknown parameter: ") + name;
        return -1;
    }

    wavchunk::ChunkerConfig candidate = impl->config;
    if (!it->second.set(candidate, value)) {
        impl->last_error = std::string("rejected ") + name + ": value out of range";
        return -1;
    }
    std::string reason;
    if (!candidate.validate(reason)) {
        impl->last_error = std::string("rejected ") + name + ": " + reason;
        return -1;
    }

    impl->config = candidate;
    impl->last_error.clear();
    return 0;
}

int chunker_get_param(ChunkerHandle handle, const char* name, double* value) {
    if (!handle || !name || !value) return -1;
    auto* impl = as_impl(handle);

    const auto& table = param_table();
    auto it = table.find(name);
    if (it == table.end()) {
        impl->last_error = std::string("unknown parameter: ") + name;
        return -1;
    }
    *value = it->second.get(impl->config);
    return 0;
}

int chunker_load_config(ChunkerHandle handle, const char* json_path) {
    if (!handle || !json_path) return -1;
    auto* impl = as_impl(handle);

    wavchunk::ChunkerConfig candidate = impl->config;
    if (!wavchunk::ConfigStore::load_from_file(candidate, json_path)) {
        impl->last_error = std::string("cannot load configuration from ") + json_path;
        return -1;
    }
    std::string reason;
    if (!candidate.validate(reason)) {
        impl->last_error = "invalid configuration: " + reason;
        return -1;
    }

    impl->config = candidate;
    impl->last_error.clear();
    return 0;
}

int chunker_process_file(ChunkerHandle handle, const char* input_path, const char* output_dir, int* chunk_count) {
    if (!handle || !input_path || !output_dir) return -1;
    auto* impl = as_impl(handle);
    if (!check_config(impl)) return -1;

    try {
        const wavchunk::ChunkPipeline pipeline(impl->config);
        const wavchunk::FileReport report = pipeline.process_file(input_path, output_dir);
        if (report.failed()) {
            impl->last_error = report.error;
            return -1;
        }
        if (chunk_count) *chunk_count = static_cast<int>(report.outputs.size());
        impl->last_error.clear();
        return 0;
    } catch (const std::exception& e) {
        impl->last_error = e.what();
        return -1;
    }
}

int chunker_process_samples(ChunkerHandle handle,
                            const float* interleaved,
                            size_t frames,
                            unsigned int sample_rate,
                            int channels,
                            int* chunk_count) {
    if (!handle || sample_rate == 0 || channels <= 0) return -1;
    if (!interleaved && frames > 0) return -1;
    auto* impl = as_impl(handle);
    if (!check_config(impl)) return -1;

    try {
        std::vector<float> samples;
        if (frames > 0) {
            samples.assign(interleaved, interleaved + frames * static_cast<size_t>(channels));
        }
        const wavchunk::AudioBuffer audio(std::move(samples), static_cast<int>(sample_rate), channels);
        const auto chunks = wavchunk::ChunkPipeline(impl->config).process(audio);
        if (chunk_count) *chunk_count = static_cast<int>(chunks.size());
        impl->last_error.clear();
        return 0;
    } catch (const std::exception& e) {
        impl->last_error = e.what();
        return -1;
    }
}

const char* chunker_last_error(ChunkerHandle handle) {
    if (!handle) return "";
    return as_impl(handle)->last_error.c_str();
}

} // extern "C"
