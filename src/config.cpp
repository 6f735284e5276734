#include "config.hpp"
#include "errors.hpp"
#include "file_chunker.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <iostream>
#include <limits>

namespace pt = boost::property_tree;

namespace ferry {

namespace {

template <typename T>
void read_key(const pt::ptree& tree, const std::string& key, T& target) {
    auto node = tree.get_child_optional(key);
    if (!node) {
        return;
    }
    auto value = node->get_value_optional<T>();
    if (!value) {
        throw ConfigError("Config key '" + key + "' has invalid value '" + node->data() + "'");
    }
    target = *value;
}

// The stream translator wraps "-1" into an unsigned field, so the sign and
// the range are checked by hand.
void read_unsigned(const pt::ptree& tree, const std::string& key, uint32_t& target) {
    auto node = tree.get_child_optional(key);
    if (!node) {
        return;
    }
    const std::string& text = node->data();
    auto first = text.find_first_not_of(" \t");
    auto value = node->get_value_optional<uint64_t>();
    if (first == std::string::npos || text[first] == '-' || !value) {
        throw ConfigError("Config key '" + key + "' has invalid value '" + text + "'");
    }
    if (*value > std::numeric_limits<uint32_t>::max()) {
        throw ConfigError("Config key '" + key + "' is out of range: " + text);
    }
    target = static_cast<uint32_t>(*value);
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

} // namespace

void Config::validate() const {
    require(chunk_size >= MIN_CHUNK_SIZE && chunk_size <= MAX_CHUNK_SIZE,
            "transfer.chunk_size must be between " + std::to_string(MIN_CHUNK_SIZE) + " and " +
            std::to_string(MAX_CHUNK_SIZE) + ", got " + std::to_string(chunk_size));
    require(!session_dir.empty(), "transfer.session_dir must not be empty");
    require(!output_dir.empty(), "transfer.output_dir must not be empty");
    require(checkpoint_interval > 0, "transfer.checkpoint_interval must be positive");
    require(transfer_timeout_ms > 0, "transfer.transfer_timeout_ms must be positive");
    require(resume_request_timeout_ms > 0, "resume.resume_request_timeout_ms must be positive");
    require(resume_wait_timeout_ms > 0, "resume.resume_wait_timeout_ms must be positive");
    require(idle_timeout_ms > 0, "resume.idle_timeout_ms must be positive");
    require(retransmit_batch > 0, "resume.retransmit_batch must be positive");
    require(min_compression_savings >= 0.0 && min_compression_savings < 1.0,
            "compression.min_savings must be in [0, 1)");
    require(pipeline_batch > 0, "pipeline.batch must be positive");
    require(worker_threads <= MAX_WORKER_THREADS,
            "pipeline.worker_threads must be at most " + std::to_string(MAX_WORKER_THREADS));
    if (compression != "auto") {
        compression_from_name(compression);
    }
}

CompressionPolicy Config::compression_policy() const {
    CompressionPolicy policy;
    policy.min_savings = min_compression_savings;
    if (compression == "auto") {
        return policy;
    }
    CompressionAlgorithm algorithm = compression_from_name(compression);
    if (algorithm == CompressionAlgorithm::None) {
        return CompressionPolicy::disabled();
    }
    policy.fixed = algorithm;
    return policy;
}

Config load_config(const std::string& path) {
    pt::ptree tree;
    try {
        pt::read_json(path, tree);
    } catch (const pt::json_parser_error& e) {
        throw ConfigError("Cannot read config " + path + ": " + e.what());
    }

    Config config;
    read_unsigned(tree, "transfer.chunk_size", config.chunk_size);
    read_key(tree, "transfer.session_dir", config.session_dir);
    read_key(tree, "transfer.output_dir", config.output_dir);
    read_unsigned(tree, "transfer.checkpoint_interval", config.checkpoint_interval);
    read_unsigned(tree, "transfer.transfer_timeout_ms", config.transfer_timeout_ms);
    read_key(tree, "transfer.dedup", config.dedup);
    read_unsigned(tree, "resume.resume_request_timeout_ms", config.resume_request_timeout_ms);
    read_unsigned(tree, "resume.resume_wait_timeout_ms", config.resume_wait_timeout_ms);
    read_unsigned(tree, "resume.idle_timeout_ms", config.idle_timeout_ms);
    read_unsigned(tree, "resume.retransmit_batch", config.retransmit_batch);
    read_key(tree, "compression.algorithm", config.compression);
    read_key(tree, "compression.min_savings", config.min_compression_savings);
    read_unsigned(tree, "pipeline.worker_threads", config.worker_threads);
    read_unsigned(tree, "pipeline.batch", config.pipeline_batch);
    read_key(tree, "log.verbose", config.verbose);

    config.validate();
    std::cout << "[Config] Loaded " << path << std::endl;
    return config;
}

void save_config(const std::string& path, const Config& config) {
    pt::ptree tree;
    tree.put("transfer.chunk_size", config.chunk_size);
    tree.put("transfer.session_dir", config.session_dir);
    tree.put("transfer.output_dir", config.output_dir);
    tree.put("transfer.checkpoint_interval", config.checkpoint_interval);
    tree.put("transfer.transfer_timeout_ms", config.transfer_timeout_ms);
    tree.put("transfer.dedup", config.dedup);
    tree.put("resume.resume_request_timeout_ms", config.resume_request_timeout_ms);
    tree.put("resume.resume_wait_timeout_ms", config.resume_wait_timeout_ms);
    tree.put("resume.idle_timeout_ms", config.idle_timeout_ms);
    tree.put("resume.retransmit_batch", config.retransmit_batch);
    tree.put("compression.algorithm", config.compression);
    tree.put("compression.min_savings", config.min_compression_savings);
    tree.put("pipeline.worker_threads", config.worker_threads);
    tree.put("pipeline.batch", config.pipeline_batch);
    tree.put("log.verbose", config.verbose);
    try {
        pt::write_json(path, tree);
    } catch (const pt::json_parser_error& e) {
        throw ConfigError("Cannot write config " + path + ": " + e.what());
    }
}

} // namespace ferry
