#include "pricing/usage_pricer.h"

#include <optional>
#include <set>
#include <unordered_map>

#include "common/error.h"
#include "common/logging.h"

namespace tokenledger::pricing {

absl::StatusOr<PricedUsage> UsagePricer::Price(const std::vector<UsageRecord>& records) {
    // Surface a missing catalog once instead of per record
    TOKENLEDGER_RETURN_IF_ERROR(fetcher_.FetchCatalog().status());

    PricedUsage result;
    result.record_costs.reserve(records.size());

    std::unordered_map<std::string, std::optional<ModelPricingEntry>> resolved;
    std::set<std::string> unpriced;

    for (const auto& record : records) {
        if (record.model_name.empty()) {
            result.record_costs.push_back(0.0);
            ++result.unpriced_records;
            continue;
        }

        auto it = resolved.find(record.model_name);
        if (it == resolved.end()) {
            TOKENLEDGER_ASSIGN_OR_RETURN(auto pricing, fetcher_.GetModelPricing(record.model_name));
            if (!pricing.has_value()) {
                TOKENLEDGER_LOG_WARN("Model pricing not found for {}; its usage is counted as $0",
                                     record.model_name);
            }
            it = resolved.emplace(record.model_name, std::move(pricing)).first;
        }

        if (!it->second.has_value()) {
            result.record_costs.push_back(0.0);
            ++result.unpriced_records;
            unpriced.insert(record.model_name);
            continue;
        }

        const double cost = fetcher_.CalculateCostFromPricing(record.tokens, *it->second);
        result.record_costs.push_back(cost);
        result.total_cost += cost;
        ++result.priced_records;
    }

    result.unpriced_models.assign(unpriced.begin(), unpriced.end());
    return result;
}

}  // namespace tokenledger::pricing
