#pragma once

/// @file fetcher.h
/// @brief Pricing catalog cache with network-then-snapshot loading

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "pricing/catalog_provider.h"
#include "pricing/catalog_source.h"
#include "pricing/cost_calculator.h"
#include "pricing/model_resolver.h"

namespace tokenledger::pricing {

/// @brief Fetcher configuration
struct FetcherConfig {
    /// Never touch the network; use the offline snapshot only
    bool offline = false;

    CatalogSourceConfig source;

    /// Snapshot paths tried before the default candidates
    std::vector<std::filesystem::path> snapshot_paths;
    bool use_default_snapshot_paths = true;

    std::vector<std::string> provider_prefixes = DefaultProviderPrefixes();
    int64_t tier_threshold = kDefaultTierThreshold;

    /// @brief Read the `pricing.*` section of a configuration
    static absl::StatusOr<FetcherConfig> FromConfig(const Config& config);
};

/// @brief Per-invocation pricing service
///
/// Loads the catalog lazily on first use and keeps it until ClearCache(),
/// Close() or destruction. Instances never share catalog state; create one per
/// report or command. A catalog that has been handed out stays valid after the
/// cache is cleared.
///
/// Loading tries the providers in order (remote source, then offline snapshot;
/// only the snapshot in offline mode) and keeps the first catalog that loads.
/// Concurrent first calls are serialized, so only one load runs.
class PricingFetcher {
public:
    /// @brief Build the default providers from the configuration
    explicit PricingFetcher(FetcherConfig config = {});

    /// @brief Use the given providers; either may be null
    PricingFetcher(FetcherConfig config,
                   std::unique_ptr<CatalogProvider> source,
                   std::unique_ptr<CatalogProvider> offline_loader);

    /// @brief Clears the cache
    ~PricingFetcher();

    // Non-copyable, non-movable
    PricingFetcher(const PricingFetcher&) = delete;
    PricingFetcher& operator=(const PricingFetcher&) = delete;

    /// @brief Return the cached catalog, loading it when necessary
    ///
    /// Fails only when no provider yields a catalog while online. Offline mode
    /// without a snapshot yields an empty catalog and a warning.
    absl::StatusOr<std::shared_ptr<const PricingCatalog>> FetchCatalog();

    /// @brief Resolve a model name to its pricing entry
    /// @return std::nullopt when the name matches nothing; an error status only
    ///         when the catalog itself cannot be loaded
    absl::StatusOr<std::optional<ModelPricingEntry>> GetModelPricing(std::string_view model_name);

    /// @brief Like GetModelPricing, with the matched key and match kind
    absl::StatusOr<std::optional<ResolvedModel>> ResolveModel(std::string_view model_name);

    /// @brief Context window (`max_input_tokens`) of the resolved model, if published
    absl::StatusOr<std::optional<int64_t>> GetModelContextLimit(std::string_view model_name);

    /// @brief Resolve the model and compute the USD cost of `tokens`
    /// @return 0 for an empty model name; ModelNotPricedError when the name
    ///         resolves to nothing
    absl::StatusOr<double> CalculateCostFromTokens(const TokenUsage& tokens,
                                                   std::string_view model_name);

    /// @brief Compute the USD cost with an already resolved entry
    double CalculateCostFromPricing(const TokenUsage& tokens,
                                    const ModelPricingEntry& pricing) const;

    /// @brief Drop the cached catalog; the next access loads again
    void ClearCache();

    /// @brief Release cached state. Safe to call more than once.
    void Close();

    /// @brief True when a catalog is cached
    bool IsLoaded() const;

    const FetcherConfig& GetConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tokenledger::pricing
