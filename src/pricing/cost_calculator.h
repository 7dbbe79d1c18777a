#pragma once

/// @file cost_calculator.h
/// @brief Tiered per-token cost calculation

#include <cstdint>
#include <optional>

#include "pricing/types.h"

namespace tokenledger::pricing {

/// @brief USD cost split by token category
struct CostBreakdown {
    double input_cost = 0.0;
    double output_cost = 0.0;
    double cache_creation_cost = 0.0;
    double cache_read_cost = 0.0;
    double total_cost = 0.0;
};

/// @brief USD rates per million tokens, for display
struct PerMillionRates {
    double input = 0.0;
    double output = 0.0;
    double cached_input = 0.0;  ///< Falls back to the input rate when the catalog has no cache-read rate
};

/// @brief Cost of a single token category
///
/// When `tokens` exceeds `threshold` and `above_rate` is set, the first
/// `threshold` tokens are billed at `base_rate` (zero when absent) and the rest
/// at `above_rate`. Otherwise all tokens are billed at `base_rate`. With no
/// applicable rate the result is 0. A count equal to the threshold stays in the
/// lower tier. Negative counts are treated as zero.
double CalculateTieredCost(int64_t tokens,
                           std::optional<double> base_rate,
                           std::optional<double> above_rate,
                           int64_t threshold = kDefaultTierThreshold);

/// @brief Per-category cost of a usage record
CostBreakdown CalculateCostBreakdown(const TokenUsage& tokens,
                                     const ModelPricingEntry& pricing,
                                     int64_t threshold = kDefaultTierThreshold);

/// @brief Total USD cost of a usage record. Pure and never fails.
double CalculateCost(const TokenUsage& tokens,
                     const ModelPricingEntry& pricing,
                     int64_t threshold = kDefaultTierThreshold);

/// @brief Convert per-token rates to per-million rates
PerMillionRates ToPerMillionRates(const ModelPricingEntry& pricing);

}  // namespace tokenledger::pricing
