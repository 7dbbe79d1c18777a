#pragma once

/// @file catalog_source.h
/// @brief Remote pricing catalog source

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include <absl/status/statusor.h>

#include "pricing/catalog_provider.h"
#include "pricing/schema.h"

namespace tokenledger::pricing {

/// LiteLLM's published price list
inline constexpr char kLiteLLMPricingUrl[] =
    "https://raw.githubusercontent.com/BerriAI/litellm/main/model_prices_and_context_window.json";

/// models.dev aggregated provider catalog
inline constexpr char kModelsDevPricingUrl[] = "https://models.dev/api.json";

/// @brief Remote source configuration
struct CatalogSourceConfig {
    /// http(s) URL, or a filesystem path for a custom local price list
    std::string url = kLiteLLMPricingUrl;
    CatalogFormat format = CatalogFormat::kLiteLLM;

    std::chrono::seconds connection_timeout{30};
    std::chrono::seconds read_timeout{60};
};

/// @brief Fetches and validates the pricing catalog
///
/// One GET per Load(), no caching. Entries that fail the schema are dropped;
/// the rest of the catalog is still returned.
class PricingCatalogSource : public CatalogProvider {
public:
    explicit PricingCatalogSource(CatalogSourceConfig config = {});
    ~PricingCatalogSource() override;

    PricingCatalogSource(const PricingCatalogSource&) = delete;
    PricingCatalogSource& operator=(const PricingCatalogSource&) = delete;

    /// @brief Fetch, parse and validate the catalog
    /// @return NetworkError on transport failure or a non-2xx status,
    ///         ParseError when the body is not a JSON object
    absl::StatusOr<PricingCatalog> Load() override;

    /// @brief Fetch the raw body without parsing it
    absl::StatusOr<std::string> FetchBody();

    std::string Name() const override;

    /// @brief Number of fetch attempts made so far
    int64_t RequestCount() const { return request_count_.load(); }

    const CatalogSourceConfig& GetConfig() const { return config_; }

private:
    absl::StatusOr<std::string> FetchHttp();
    absl::StatusOr<std::string> ReadLocalFile();

    CatalogSourceConfig config_;
    std::atomic<int64_t> request_count_{0};
};

/// @brief Split an http(s) URL into "scheme://host[:port]" and the request path
/// @return InvalidArgument when the URL has no scheme or host
absl::StatusOr<std::pair<std::string, std::string>> SplitUrl(const std::string& url);

/// @brief True when the string starts with http:// or https://
bool IsHttpUrl(const std::string& url);

}  // namespace tokenledger::pricing
