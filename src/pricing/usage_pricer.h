#pragma once

/// @file usage_pricer.h
/// @brief Pricing of many usage records against one catalog

#include <cstdint>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "pricing/fetcher.h"

namespace tokenledger::pricing {

/// @brief One usage record as supplied by a log parser
struct UsageRecord {
    std::string model_name;
    TokenUsage tokens;
};

/// @brief Costs for a batch of records
struct PricedUsage {
    std::vector<double> record_costs;         ///< Same order as the input records
    double total_cost = 0.0;
    int64_t priced_records = 0;
    int64_t unpriced_records = 0;
    std::vector<std::string> unpriced_models;  ///< Sorted, without duplicates
};

/// @brief Prices usage records, tolerating unknown models
///
/// A model that resolves to nothing contributes zero and is reported once at
/// warn level; every other record is priced normally. Each distinct model name
/// is resolved once per Price() call.
class UsagePricer {
public:
    explicit UsagePricer(PricingFetcher& fetcher) : fetcher_(fetcher) {}

    /// @return An error only when the catalog cannot be loaded at all
    absl::StatusOr<PricedUsage> Price(const std::vector<UsageRecord>& records);

private:
    PricingFetcher& fetcher_;
};

}  // namespace tokenledger::pricing
