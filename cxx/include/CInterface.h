/**
 * @file CInterface.h
 * @brief C-compatible API layer over the chunking pipeline.
 *
 * Lets non-C++ hosts (Python via ctypes, Swift, C#) run the same
 * segmentation as the wavchunk CLI. All functions return 0 on success
 * and -1 on failure unless stated otherwise.
 */

#ifndef WAVCHUNK_C_INTERFACE_H
#define WAVCHUNK_C_INTERFACE_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Opaque handle type
typedef void* ChunkerHandle;

// Lifecycle. chunker_create returns NULL on failure.
ChunkerHandle chunker_create(void);
void chunker_destroy(ChunkerHandle handle);

// Parameters by option name, e.g. "max_sec", "silence_thresh", "gap_ms"
int chunker_set_param(ChunkerHandle handle, const char* name, double value);
int chunker_get_param(ChunkerHandle handle, const char* name, double* value);
int chunker_load_config(ChunkerHandle handle, const char* json_path);

// Processing
int chunker_process_file(ChunkerHandle handle,
                         const char* input_path,
                         const char* output_dir,
                         int* chunk_count);

// In-memory run over interleaved float samples; only the chunk count is returned
int chunker_process_samples(ChunkerHandle handle,
                            const float* interleaved,
                            size_t frames,
                            unsigned int sample_rate,
                            int channels,
                            int* chunk_count);

// Reason for the last failure on this handle, "" if none. Never NULL.
const char* chunker_last_error(ChunkerHandle handle);

#ifdef __cplusplus
}
#endif

#endif // WAVCHUNK_C_INTERFACE_H
