#include "pricing/cost_calculator.h"

#include <algorithm>

namespace tokenledger::pricing {

namespace {

constexpr double kMillion = 1000000.0;

}  // namespace

double CalculateTieredCost(int64_t tokens,
                           std::optional<double> base_rate,
                           std::optional<double> above_rate,
                           int64_t threshold) {
    if (tokens <= 0) {
        return 0.0;
    }
    threshold = std::max<int64_t>(threshold, 0);

    if (tokens > threshold && above_rate.has_value()) {
        const int64_t below = std::min(tokens, threshold);
        const int64_t above = tokens - threshold;

        double cost = static_cast<double>(above) * *above_rate;
        if (base_rate.has_value()) {
            cost += static_cast<double>(below) * *base_rate;
        }
        return cost;
    }

    if (base_rate.has_value()) {
        return static_cast<double>(tokens) * *base_rate;
    }
    return 0.0;
}

CostBreakdown CalculateCostBreakdown(const TokenUsage& tokens,
                                     const ModelPricingEntry& pricing,
                                     int64_t threshold) {
    CostBreakdown breakdown;
    breakdown.input_cost = CalculateTieredCost(
        tokens.input_tokens,
        pricing.input_cost_per_token,
        pricing.input_cost_per_token_above_threshold,
        threshold);
    breakdown.output_cost = CalculateTieredCost(
        tokens.output_tokens,
        pricing.output_cost_per_token,
        pricing.output_cost_per_token_above_threshold,
        threshold);
    breakdown.cache_creation_cost = CalculateTieredCost(
        tokens.cache_creation_input_tokens,
        pricing.cache_creation_input_token_cost,
        pricing.cache_creation_input_token_cost_above_threshold,
        threshold);
    breakdown.cache_read_cost = CalculateTieredCost(
        tokens.cache_read_input_tokens,
        pricing.cache_read_input_token_cost,
        pricing.cache_read_input_token_cost_above_threshold,
        threshold);

    breakdown.total_cost = breakdown.input_cost + breakdown.output_cost +
                           breakdown.cache_creation_cost + breakdown.cache_read_cost;
    return breakdown;
}

double CalculateCost(const TokenUsage& tokens,
                     const ModelPricingEntry& pricing,
                     int64_t threshold) {
    return CalculateCostBreakdown(tokens, pricing, threshold).total_cost;
}

PerMillionRates ToPerMillionRates(const ModelPricingEntry& pricing) {
    PerMillionRates rates;
    rates.input = pricing.input_cost_per_token.value_or(0.0) * kMillion;
    rates.output = pricing.output_cost_per_token.value_or(0.0) * kMillion;
    rates.cached_input = pricing.cache_read_input_token_cost
                             .value_or(pricing.input_cost_per_token.value_or(0.0)) * kMillion;
    return rates;
}

}  // namespace tokenledger::pricing
