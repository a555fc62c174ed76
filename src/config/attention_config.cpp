#include "mhsa/config/attention_config.hpp"
#include "mhsa/core/errors.hpp"
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace mhsa {

namespace {

// Dimensions and seeds must be non-negative JSON integers that fit the field
template <typename T>
T unsigned_field(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_unsigned()) {
        throw InvalidConfiguration(key + " must be a non-negative integer, got " + value.dump());
    }
    auto raw = value.get<std::uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        throw InvalidConfiguration(key + " is out of range: " + value.dump());
    }
    return static_cast<T>(raw);
}

} // anonymous namespace

std::string to_string(AttentionBackend backend) {
    switch (backend) {
        case AttentionBackend::Manual: return "manual";
        case AttentionBackend::Fused: return "fused";
    }
    return "unknown";
}

AttentionBackend backend_from_string(const std::string& name) {
    if (name == "manual") return AttentionBackend::Manual;
    if (name == "fused") return AttentionBackend::Fused;
    throw InvalidConfiguration("Unknown attention backend: " + name);
}

void AttentionConfig::validate() const {
    if (!(dropout_rate >= 0.0f && dropout_rate <= 1.0f)) {
        throw InvalidConfiguration("dropout_rate should be between 0 and 1, got " +
                                   std::to_string(dropout_rate));
    }
    if (hidden_size == 0) {
        throw InvalidConfiguration("hidden_size must be positive");
    }
    if (num_heads == 0) {
        throw InvalidConfiguration("num_heads must be positive");
    }
    if (head_dim) {
        if (*head_dim == 0) {
            throw InvalidConfiguration("head_dim must be positive");
        }
    } else if (hidden_size % num_heads != 0) {
        throw InvalidConfiguration("hidden_size " + std::to_string(hidden_size) +
                                   " should be divisible by num_heads " + std::to_string(num_heads));
    }
    if (block_size == 0) {
        throw InvalidConfiguration("block_size must be positive");
    }
}

void AttentionConfig::print() const {
    std::cout << "=== Attention Configuration ===" << std::endl;
    std::cout << "Hidden Size: " << hidden_size << std::endl;
    std::cout << "Num Heads: " << num_heads << std::endl;
    std::cout << "Head Dim: " << resolved_head_dim() << (head_dim ? "" : " (derived)") << std::endl;
    std::cout << "Dropout Rate: " << dropout_rate << std::endl;
    std::cout << "QKV Bias: " << (qkv_bias ? "true" : "false") << std::endl;
    std::cout << "Save Attention: " << (save_attention ? "true" : "false") << std::endl;
    std::cout << "Backend: " << to_string(backend) << std::endl;
    std::cout << "Block Size: " << block_size << std::endl;
    std::cout << "Seed: " << (seed ? std::to_string(*seed) : std::string("random")) << std::endl;
    std::cout << "===============================" << std::endl;
}

void to_json(nlohmann::json& j, const AttentionConfig& config) {
    j = nlohmann::json{
        {"hidden_size", config.hidden_size},
        {"num_heads", config.num_heads},
        {"dropout_rate", config.dropout_rate},
        {"qkv_bias", config.qkv_bias},
        {"save_attention", config.save_attention},
        {"backend", to_string(config.backend)},
        {"block_size", config.block_size}
    };
    j["head_dim"] = config.head_dim ? nlohmann::json(*config.head_dim) : nlohmann::json(nullptr);
    j["seed"] = config.seed ? nlohmann::json(*config.seed) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, AttentionConfig& config) {
    AttentionConfig defaults;

    config.hidden_size = unsigned_field<size_t>(j.at("hidden_size"), "hidden_size");
    config.num_heads = unsigned_field<size_t>(j.at("num_heads"), "num_heads");
    config.dropout_rate = j.value("dropout_rate", defaults.dropout_rate);
    config.qkv_bias = j.value("qkv_bias", defaults.qkv_bias);
    config.save_attention = j.value("save_attention", defaults.save_attention);
    config.block_size = j.contains("block_size")
        ? unsigned_field<size_t>(j["block_size"], "block_size")
        : defaults.block_size;
    config.backend = backend_from_string(j.value("backend", to_string(defaults.backend)));

    if (j.contains("head_dim") && !j["head_dim"].is_null()) {
        config.head_dim = unsigned_field<size_t>(j["head_dim"], "head_dim");
    } else {
        config.head_dim.reset();
    }

    if (j.contains("seed") && !j["seed"].is_null()) {
        config.seed = unsigned_field<std::uint32_t>(j["seed"], "seed");
    } else {
        config.seed.reset();
    }
}

AttentionConfig load_attention_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        return j.get<AttentionConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
}

void save_attention_config(const AttentionConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }

    file << nlohmann::json(config).dump(2); // Pretty print with 2-space indentation
    if (!file) {
        throw std::runtime_error("Failed to save config: " + path);
    }
}

} // namespace mhsa
