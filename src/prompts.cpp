//
// Created by Sanger Steel on 6/15/25.
//

#include "prompts.hpp"
#include <format>
#include <stdexcept>

UuidPromptSource::UuidPromptSource(std::string base_prompt, int target_tokens)
    : UuidPromptSource(std::move(base_prompt), target_tokens, std::random_device{}()) {
}

UuidPromptSource::UuidPromptSource(std::string base_prompt, int target_tokens, uint64_t seed)
    : base_prompt(std::move(base_prompt)), target_tokens(target_tokens), rng(seed) {
}

std::vector<PromptRecord> UuidPromptSource::generate(size_t count) {
    std::lock_guard<std::mutex> lock(mu);
    std::vector<PromptRecord> records;
    records.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        PromptRecord record;
        record.id = generate_uuid_v4(rng);
        record.text = std::format("{} {}", record.id, base_prompt);
        record.target_tokens = target_tokens;
        records.emplace_back(std::move(record));
    }
    return records;
}

std::string generate_uuid_v4(std::mt19937_64& rng) {
    uint64_t hi = rng();
    uint64_t lo = rng();
    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       (uint32_t) (hi >> 32), (uint16_t) (hi >> 16), (uint16_t) hi,
                       (uint16_t) (lo >> 48), lo & 0xFFFFFFFFFFFFULL);
}

const char* pool_exhaustion_as_str(PoolExhaustion policy) {
    switch (policy) {
        case PoolExhaustion::CYCLE: return "cycle";
        case PoolExhaustion::EXTEND: return "extend";
        default: return "invalid";
    }
}

PoolExhaustion pool_exhaustion_from_str(const std::string& str) {
    if (str == "cycle") return PoolExhaustion::CYCLE;
    if (str == "extend") return PoolExhaustion::EXTEND;
    throw std::invalid_argument(std::format("Unknown pool exhaustion policy: {}", str));
}

PromptPool::PromptPool(PromptSource& source, size_t initial_size, PoolExhaustion policy)
    : source(source), policy(policy), extend_chunk(initial_size > 0 ? initial_size : 1) {
    records = source.generate(initial_size);
}

PromptRecord PromptPool::claim() {
    std::lock_guard<std::mutex> lock(mu);
    if (next >= records.size()) {
        if (policy == PoolExhaustion::CYCLE && !records.empty()) {
            return records[next++ % records.size()];
        }
        auto more = source.generate(extend_chunk);
        if (more.empty()) {
            throw std::runtime_error("Prompt source returned no records");
        }
        records.insert(records.end(),
                       std::make_move_iterator(more.begin()),
                       std::make_move_iterator(more.end()));
    }
    return records[next++];
}

size_t PromptPool::claimed() const {
    std::lock_guard<std::mutex> lock(mu);
    return next;
}

size_t PromptPool::size() const {
    std::lock_guard<std::mutex> lock(mu);
    return records.size();
}
