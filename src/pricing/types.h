#pragma once

/// @file types.h
/// @brief Pricing data model: per-token rates and token usage counts

#include <cstdint>
#include <optional>

namespace tokenledger::pricing {

/// Token count above which the tiered ("above threshold") rates apply.
/// Catalog fields carrying tiered rates are published as `*_above_200k_tokens`.
inline constexpr int64_t kDefaultTierThreshold = 200000;

/// @brief Per-token USD rates for one model
///
/// Every field is optional. An absent rate means the catalog has no information
/// for that category, which is not the same as a zero price.
struct ModelPricingEntry {
    std::optional<double> input_cost_per_token;
    std::optional<double> output_cost_per_token;
    std::optional<double> cache_creation_input_token_cost;
    std::optional<double> cache_read_input_token_cost;

    // Rates applied to the part of a count beyond the tier threshold
    std::optional<double> input_cost_per_token_above_threshold;
    std::optional<double> output_cost_per_token_above_threshold;
    std::optional<double> cache_creation_input_token_cost_above_threshold;
    std::optional<double> cache_read_input_token_cost_above_threshold;

    std::optional<int64_t> max_tokens;
    std::optional<int64_t> max_input_tokens;
    std::optional<int64_t> max_output_tokens;

    bool operator==(const ModelPricingEntry&) const = default;
};

/// @brief Token counts for one usage record or an aggregate of records
struct TokenUsage {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    int64_t cache_creation_input_tokens = 0;
    int64_t cache_read_input_tokens = 0;

    TokenUsage& operator+=(const TokenUsage& other) {
        input_tokens += other.input_tokens;
        output_tokens += other.output_tokens;
        cache_creation_input_tokens += other.cache_creation_input_tokens;
        cache_read_input_tokens += other.cache_read_input_tokens;
        return *this;
    }

    bool operator==(const TokenUsage&) const = default;
};

}  // namespace tokenledger::pricing
