//
// Created by Sanger Steel on 6/15/25.
//

#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

struct PromptRecord {
    std::string id;
    std::string text;
    int target_tokens = 0;
};

class PromptSource {
public:
    virtual ~PromptSource() = default;

    // Each call returns `count` records never handed out before
    virtual std::vector<PromptRecord> generate(size_t count) = 0;
};

// Prefixes a fixed base prompt with a fresh UUID so no two requests share a
// prompt and server-side prefix caches can't short-circuit them.
class UuidPromptSource final : public PromptSource {
public:
    UuidPromptSource(std::string base_prompt, int target_tokens);

    UuidPromptSource(std::string base_prompt, int target_tokens, uint64_t seed);

    std::vector<PromptRecord> generate(size_t count) override;

private:
    std::string base_prompt;
    int target_tokens;
    std::mutex mu;
    std::mt19937_64 rng;
};

std::string generate_uuid_v4(std::mt19937_64& rng);

enum class PoolExhaustion {
    CYCLE,   // hand the pool's records out again, round-robin
    EXTEND,  // ask the source for more records
};

const char* pool_exhaustion_as_str(PoolExhaustion policy);

PoolExhaustion pool_exhaustion_from_str(const std::string& str);

// The records one run draws from. Workers claim concurrently; each record
// is handed out at most once unless the pool cycles.
class PromptPool {
public:
    PromptPool(PromptSource& source, size_t initial_size, PoolExhaustion policy);

    PromptRecord claim();

    size_t claimed() const;

    size_t size() const;

private:
    PromptSource& source;
    PoolExhaustion policy;
    size_t extend_chunk;
    mutable std::mutex mu;
    std::vector<PromptRecord> records;
    size_t next = 0;
};
