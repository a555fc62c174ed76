#include "mhsa/config/attention_config.hpp"
#include "mhsa/core/errors.hpp"
#include "mhsa/models/self_attention_block.hpp"
#include "test_check.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

using mhsa::AttentionBackend;
using mhsa::AttentionConfig;
using mhsa::InvalidConfiguration;

int main() {
    std::cout << "Testing AttentionConfig..." << std::endl;
    mhsa_test::Checker checker;

    const std::string config_path = "test_attention_config.json";
    const std::string broken_path = "test_attention_config_broken.json";

    try {
        // Test 1
        std::cout << "\n=== Test 1: Defaults and validation ===" << std::endl;
        AttentionConfig config;
        config.hidden_size = 768;
        config.num_heads = 12;
        config.print();
        checker.check(config.resolved_head_dim() == 64 && config.inner_dim() == 768, "derived head_dim");
        checker.check(config.dropout_rate == 0.0f && !config.qkv_bias && !config.save_attention,
                      "dropout 0, no qkv bias, no snapshot by default");
        checker.check(config.backend == AttentionBackend::Manual && config.block_size == 64, "manual backend, block 64");

        config.validate();
        checker.check(true, "768 / 12 validates");

        AttentionConfig odd = config;
        odd.hidden_size = 10;
        odd.num_heads = 3;
        checker.expect_throw<InvalidConfiguration>([&]() { odd.validate(); }, "10 / 3 without head_dim");
        odd.head_dim = 4;
        odd.validate();
        checker.check(odd.inner_dim() == 12, "explicit head_dim sets inner_dim");

        AttentionConfig bad_rate = config;
        bad_rate.dropout_rate = 1.5f;
        checker.expect_throw<InvalidConfiguration>([&]() { bad_rate.validate(); }, "dropout 1.5");
        AttentionConfig bad_block = config;
        bad_block.block_size = 0;
        checker.expect_throw<InvalidConfiguration>([&]() { bad_block.validate(); }, "block_size 0");

        // Test 2
        std::cout << "\n=== Test 2: JSON mapping ===" << std::endl;
        AttentionConfig full = config;
        full.dropout_rate = 0.25f;
        full.qkv_bias = true;
        full.save_attention = true;
        full.head_dim = 32;
        full.backend = AttentionBackend::Fused;
        full.seed = 77;
        full.block_size = 16;

        nlohmann::json j = full;
        checker.check(j["backend"] == "fused" && j["head_dim"] == 32 && j["seed"] == 77, "json fields");
        AttentionConfig parsed = j.get<AttentionConfig>();
        checker.check(parsed.hidden_size == 768 && parsed.num_heads == 12 && parsed.dropout_rate == 0.25f &&
                          parsed.qkv_bias && parsed.save_attention && parsed.head_dim == 32u &&
                          parsed.backend == AttentionBackend::Fused && parsed.seed == 77u &&
                          parsed.block_size == 16,
                      "every field survives json");

        nlohmann::json minimal = {{"hidden_size", 64}, {"num_heads", 8}};
        AttentionConfig from_minimal = minimal.get<AttentionConfig>();
        checker.check(!from_minimal.head_dim && !from_minimal.seed && from_minimal.resolved_head_dim() == 8,
                      "optional fields default when absent");

        nlohmann::json nulls = j;
        nulls["head_dim"] = nullptr;
        nulls["seed"] = nullptr;
        AttentionConfig from_nulls = nulls.get<AttentionConfig>();
        checker.check(!from_nulls.head_dim && !from_nulls.seed, "null optional fields");

        nlohmann::json unknown_backend = minimal;
        unknown_backend["backend"] = "flash";
        checker.expect_throw<InvalidConfiguration>([&]() { (void)unknown_backend.get<AttentionConfig>(); },
                                                   "unknown backend name");

        for (const char* key : {"hidden_size", "num_heads", "head_dim", "block_size", "seed"}) {
            nlohmann::json negative = minimal;
            negative[key] = -8;
            checker.expect_throw<InvalidConfiguration>([&]() { (void)negative.get<AttentionConfig>(); },
                                                       std::string("negative ") + key);
        }
        nlohmann::json fractional = minimal;
        fractional["num_heads"] = 2.5;
        checker.expect_throw<InvalidConfiguration>([&]() { (void)fractional.get<AttentionConfig>(); },
                                                   "fractional num_heads");
        nlohmann::json huge_seed = minimal;
        huge_seed["seed"] = 5000000000ULL;
        checker.expect_throw<InvalidConfiguration>([&]() { (void)huge_seed.get<AttentionConfig>(); },
                                                   "seed beyond 32 bits");

        // Test 3
        std::cout << "\n=== Test 3: Config files ===" << std::endl;
        mhsa::save_attention_config(full, config_path);
        AttentionConfig loaded = mhsa::load_attention_config(config_path);
        checker.check(loaded.head_dim == full.head_dim && loaded.backend == full.backend &&
                          loaded.dropout_rate == full.dropout_rate && loaded.seed == full.seed,
                      "config file round trip");

        mhsa::SelfAttentionBlock block(loaded);
        checker.check(block.backend() == AttentionBackend::Fused && block.inner_dim() == 384,
                      "block built from a loaded config");

        checker.expect_throw<std::runtime_error>([]() { (void)mhsa::load_attention_config("no_such_config.json"); },
                                                 "missing file");
        {
            std::ofstream broken(broken_path);
            broken << "{ \"hidden_size\": 16, ";
        }
        checker.expect_throw<std::runtime_error>([&]() { (void)mhsa::load_attention_config(broken_path); },
                                                 "malformed json");
        {
            std::ofstream incomplete(broken_path);
            incomplete << "{ \"num_heads\": 2 }";
        }
        checker.expect_throw<std::runtime_error>([&]() { (void)mhsa::load_attention_config(broken_path); },
                                                 "missing hidden_size");
        {
            std::ofstream negative(broken_path);
            negative << "{ \"hidden_size\": -8, \"num_heads\": 2 }";
        }
        checker.expect_throw<InvalidConfiguration>([&]() { (void)mhsa::load_attention_config(broken_path); },
                                                   "negative hidden_size in a config file");

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::remove(config_path.c_str());
        std::remove(broken_path.c_str());
        return 1;
    }

    std::remove(config_path.c_str());
    std::remove(broken_path.c_str());
    return checker.finish("AttentionConfig");
}
