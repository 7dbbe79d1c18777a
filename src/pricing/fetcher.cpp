#include "pricing/fetcher.h"

#include <mutex>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"
#include "pricing/offline_loader.h"

namespace tokenledger::pricing {

// ============================================================================
// FetcherConfig
// ============================================================================

absl::StatusOr<FetcherConfig> FetcherConfig::FromConfig(const Config& config) {
    FetcherConfig result;

    result.offline = config.GetBool("pricing.offline", result.offline);
    result.source.url = config.GetString("pricing.url", result.source.url);

    if (config.HasKey("pricing.format")) {
        auto format = ParseCatalogFormat(config.GetString("pricing.format"));
        if (!format.ok()) {
            return MakeError(ErrorCode::kConfigurationError, format.status().message());
        }
        result.source.format = *format;
        if (*format == CatalogFormat::kModelsDev && !config.HasKey("pricing.url")) {
            result.source.url = kModelsDevPricingUrl;
        }
    }

    result.source.connection_timeout = std::chrono::seconds(
        config.GetInt("pricing.connection_timeout_seconds",
                      result.source.connection_timeout.count()));
    result.source.read_timeout = std::chrono::seconds(
        config.GetInt("pricing.read_timeout_seconds", result.source.read_timeout.count()));

    // Either an explicit list or the name of a preset
    if (config.IsList("pricing.provider_prefixes")) {
        result.provider_prefixes = config.GetStringList("pricing.provider_prefixes");
    } else if (config.HasKey("pricing.provider_prefixes")) {
        auto preset = ProviderPrefixPreset(config.GetString("pricing.provider_prefixes"));
        if (!preset.ok()) {
            return MakeError(ErrorCode::kConfigurationError, preset.status().message());
        }
        result.provider_prefixes = *std::move(preset);
    }

    for (const auto& path : config.GetStringList("pricing.snapshot_paths")) {
        result.snapshot_paths.emplace_back(path);
    }
    result.use_default_snapshot_paths =
        config.GetBool("pricing.use_default_snapshot_paths", result.use_default_snapshot_paths);

    result.tier_threshold = config.GetInt("pricing.tier_threshold", result.tier_threshold);
    if (result.tier_threshold < 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         "pricing.tier_threshold must not be negative");
    }

    return result;
}

// ============================================================================
// PricingFetcher implementation
// ============================================================================

class PricingFetcher::Impl {
public:
    Impl(FetcherConfig config,
         std::unique_ptr<CatalogProvider> source,
         std::unique_ptr<CatalogProvider> offline_loader)
        : config_(std::move(config)),
          source_(std::move(source)),
          offline_loader_(std::move(offline_loader)) {}

    absl::StatusOr<std::shared_ptr<const PricingCatalog>> FetchCatalog() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (catalog_) {
            return catalog_;
        }

        std::vector<std::string> failures;
        for (CatalogProvider* provider : ProviderChain()) {
            if (!failures.empty()) {
                TOKENLEDGER_LOG_WARN(
                    "Failed to fetch model pricing, falling back to {}", provider->Name());
            }

            auto loaded = provider->Load();
            if (loaded.ok()) {
                catalog_ = std::make_shared<const PricingCatalog>(*std::move(loaded));
                return catalog_;
            }

            TOKENLEDGER_LOG_DEBUG("{} failed: {}", provider->Name(), loaded.status().ToString());
            failures.push_back(absl::StrCat(provider->Name(), ": ", loaded.status().message()));
        }

        if (config_.offline) {
            TOKENLEDGER_LOG_WARN(
                "No offline pricing data available; costs for all models will be reported as unpriced");
            catalog_ = std::make_shared<const PricingCatalog>();
            return catalog_;
        }

        TOKENLEDGER_LOG_ERROR("Failed to load pricing data from every source: {}",
                              absl::StrJoin(failures, "; "));
        return UnavailableError(absl::StrCat(
            "Pricing catalog unavailable: ", absl::StrJoin(failures, "; ")));
    }

    absl::StatusOr<std::optional<ResolvedModel>> ResolveModel(std::string_view model_name) {
        TOKENLEDGER_ASSIGN_OR_RETURN(auto catalog, FetchCatalog());
        return Resolve(*catalog, model_name, config_.provider_prefixes);
    }

    void ClearCache() {
        std::lock_guard<std::mutex> lock(mutex_);
        catalog_.reset();
    }

    bool IsLoaded() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return catalog_ != nullptr;
    }

    const FetcherConfig& GetConfig() const { return config_; }

private:
    std::vector<CatalogProvider*> ProviderChain() const {
        std::vector<CatalogProvider*> chain;
        if (!config_.offline && source_) {
            chain.push_back(source_.get());
        }
        if (offline_loader_) {
            chain.push_back(offline_loader_.get());
        }
        return chain;
    }

    FetcherConfig config_;
    std::unique_ptr<CatalogProvider> source_;
    std::unique_ptr<CatalogProvider> offline_loader_;

    mutable std::mutex mutex_;
    std::shared_ptr<const PricingCatalog> catalog_;
};

namespace {

std::unique_ptr<CatalogProvider> MakeDefaultLoader(const FetcherConfig& config) {
    if (config.use_default_snapshot_paths) {
        return std::make_unique<OfflineSnapshotLoader>(
            OfflineSnapshotLoader::WithDefaultPaths(config.snapshot_paths));
    }
    return std::make_unique<OfflineSnapshotLoader>(config.snapshot_paths);
}

}  // namespace

PricingFetcher::PricingFetcher(FetcherConfig config)
    : PricingFetcher(config,
                     std::make_unique<PricingCatalogSource>(config.source),
                     MakeDefaultLoader(config)) {}

PricingFetcher::PricingFetcher(FetcherConfig config,
                               std::unique_ptr<CatalogProvider> source,
                               std::unique_ptr<CatalogProvider> offline_loader)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(source),
                                   std::move(offline_loader))) {}

PricingFetcher::~PricingFetcher() {
    Close();
}

absl::StatusOr<std::shared_ptr<const PricingCatalog>> PricingFetcher::FetchCatalog() {
    return impl_->FetchCatalog();
}

absl::StatusOr<std::optional<ModelPricingEntry>> PricingFetcher::GetModelPricing(
    std::string_view model_name) {
    TOKENLEDGER_ASSIGN_OR_RETURN(auto resolved, impl_->ResolveModel(model_name));
    if (!resolved.has_value()) {
        return std::optional<ModelPricingEntry>();
    }
    return std::optional<ModelPricingEntry>(std::move(resolved->pricing));
}

absl::StatusOr<std::optional<ResolvedModel>> PricingFetcher::ResolveModel(
    std::string_view model_name) {
    return impl_->ResolveModel(model_name);
}

absl::StatusOr<std::optional<int64_t>> PricingFetcher::GetModelContextLimit(
    std::string_view model_name) {
    TOKENLEDGER_ASSIGN_OR_RETURN(auto pricing, GetModelPricing(model_name));
    if (!pricing.has_value()) {
        return std::optional<int64_t>();
    }
    return pricing->max_input_tokens;
}

absl::StatusOr<double> PricingFetcher::CalculateCostFromTokens(const TokenUsage& tokens,
                                                               std::string_view model_name) {
    if (model_name.empty()) {
        return 0.0;
    }

    TOKENLEDGER_ASSIGN_OR_RETURN(auto pricing, GetModelPricing(model_name));
    if (!pricing.has_value()) {
        return ModelNotPricedError(model_name);
    }
    return CalculateCostFromPricing(tokens, *pricing);
}

double PricingFetcher::CalculateCostFromPricing(const TokenUsage& tokens,
                                                const ModelPricingEntry& pricing) const {
    return CalculateCost(tokens, pricing, impl_->GetConfig().tier_threshold);
}

void PricingFetcher::ClearCache() {
    impl_->ClearCache();
}

void PricingFetcher::Close() {
    if (impl_) {
        impl_->ClearCache();
    }
}

bool PricingFetcher::IsLoaded() const {
    return impl_->IsLoaded();
}

const FetcherConfig& PricingFetcher::GetConfig() const {
    return impl_->GetConfig();
}

}  // namespace tokenledger::pricing
