#pragma once

#include "compressor.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace ferry {

const uint32_t MAX_WORKER_THREADS = 256;

// Every tunable of a transfer, with its default.
struct Config {
    // "transfer"
    uint32_t chunk_size = 1024 * 1024;
    std::string session_dir = ".ferry/sessions";
    std::string output_dir = ".";
    uint32_t checkpoint_interval = 10;
    uint32_t transfer_timeout_ms = 300000;
    // Copy chunks the receiver already holds in earlier files.
    bool dedup = true;

    // "resume"
    uint32_t resume_request_timeout_ms = 2000;
    uint32_t resume_wait_timeout_ms = 500;
    uint32_t idle_timeout_ms = 1000;
    uint32_t retransmit_batch = 256;

    // "compression": auto, none, fast, balanced or high
    std::string compression = "auto";
    double min_compression_savings = 0.05;

    // "pipeline"
    uint32_t worker_threads = 0;
    uint32_t pipeline_batch = 8;

    // "log"
    bool verbose = false;

    // Throws ConfigError naming the offending key.
    void validate() const;

    CompressionPolicy compression_policy() const;

    std::string outgoing_session_dir() const { return session_dir + "/outgoing"; }
    std::string incoming_session_dir() const { return session_dir + "/incoming"; }
    std::string chunk_index_path() const { return incoming_session_dir() + "/chunks.index"; }

    std::chrono::milliseconds resume_request_timeout() const { return std::chrono::milliseconds(resume_request_timeout_ms); }
    std::chrono::milliseconds resume_wait_timeout() const { return std::chrono::milliseconds(resume_wait_timeout_ms); }
    std::chrono::milliseconds idle_timeout() const { return std::chrono::milliseconds(idle_timeout_ms); }
    std::chrono::milliseconds transfer_timeout() const { return std::chrono::milliseconds(transfer_timeout_ms); }
};

// Reads a JSON file with "transfer", "resume", "compression", "pipeline" and
// "log" objects. Missing keys keep their defaults, unknown keys are ignored.
// Throws ConfigError.
Config load_config(const std::string& path);

// Writes every key, producing a file load_config() accepts. Throws ConfigError.
void save_config(const std::string& path, const Config& config);

} // namespace ferry
