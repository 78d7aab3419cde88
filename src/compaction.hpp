#pragma once
#include "message.hpp"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace soulwire {

class Provider;

// Pluggable per-model token accounting.
class TokenEstimator {
public:
    virtual ~TokenEstimator() = default;
    virtual uint32_t estimate(const std::vector<Message>& messages) const = 0;
};

// ~4 characters per token over every part, including tool arguments.
class CharRatioEstimator : public TokenEstimator {
public:
    uint32_t estimate(const std::vector<Message>& messages) const override;
};

// Produces the text of the synthetic message that replaces a compacted
// prefix. Must be deterministic for a given prefix to keep compaction
// idempotent.
class Summarizer {
public:
    virtual ~Summarizer() = default;
    virtual std::string summarize(const std::vector<Message>& prefix) = 0;
};

// Counts messages by role and lists the first line of each user message.
class CountingSummarizer : public Summarizer {
public:
    std::string summarize(const std::vector<Message>& prefix) override;
};

// Asks the model provider for a summary; falls back to counting when the
// provider call fails.
class ProviderSummarizer : public Summarizer {
public:
    ProviderSummarizer(std::shared_ptr<Provider> provider, std::string model);
    std::string summarize(const std::vector<Message>& prefix) override;

private:
    std::shared_ptr<Provider> provider_;
    std::string model_;
    CountingSummarizer fallback_;
};

} // namespace soulwire
