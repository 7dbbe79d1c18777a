#include "pricing/catalog_source.h"

#include <fstream>
#include <sstream>
#include <utility>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <httplib.h>

#include "common/error.h"
#include "common/logging.h"

namespace tokenledger::pricing {

bool IsHttpUrl(const std::string& url) {
    return absl::StartsWith(url, "http://") || absl::StartsWith(url, "https://");
}

absl::StatusOr<std::pair<std::string, std::string>> SplitUrl(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return absl::InvalidArgumentError(absl::StrCat("URL has no scheme: ", url));
    }
    const auto host_start = scheme_end + 3;
    const auto path_start = url.find('/', host_start);
    if (path_start == host_start) {
        return absl::InvalidArgumentError(absl::StrCat("URL has no host: ", url));
    }
    if (path_start == std::string::npos) {
        if (host_start >= url.size()) {
            return absl::InvalidArgumentError(absl::StrCat("URL has no host: ", url));
        }
        return std::make_pair(url, std::string("/"));
    }
    return std::make_pair(url.substr(0, path_start), url.substr(path_start));
}

PricingCatalogSource::PricingCatalogSource(CatalogSourceConfig config)
    : config_(std::move(config)) {}

PricingCatalogSource::~PricingCatalogSource() = default;

std::string PricingCatalogSource::Name() const {
    return config_.format == CatalogFormat::kModelsDev ? "models.dev" : "LiteLLM";
}

absl::StatusOr<PricingCatalog> PricingCatalogSource::Load() {
    TOKENLEDGER_ASSIGN_OR_RETURN(std::string body, FetchBody());

    auto catalog = ParseCatalog(body, config_.format);
    if (!catalog.ok()) {
        return catalog.status();
    }
    TOKENLEDGER_LOG_INFO("Loaded pricing for {} models from {}", catalog->size(), Name());
    return catalog;
}

absl::StatusOr<std::string> PricingCatalogSource::FetchBody() {
    request_count_.fetch_add(1);

    if (IsHttpUrl(config_.url)) {
        TOKENLEDGER_LOG_INFO("Fetching latest model pricing from {}...", Name());
        return FetchHttp();
    }

    TOKENLEDGER_LOG_INFO("Loading model pricing from local file: {}", config_.url);
    return ReadLocalFile();
}

absl::StatusOr<std::string> PricingCatalogSource::FetchHttp() {
    auto parts = SplitUrl(config_.url);
    if (!parts.ok()) {
        return NetworkError(parts.status().message());
    }
    const auto& [scheme_host, path] = *parts;

    try {
        httplib::Client client(scheme_host);
        if (!client.is_valid()) {
            return NetworkError(absl::StrCat(
                "Failed to fetch model pricing: unsupported URL ", config_.url));
        }
        client.set_connection_timeout(config_.connection_timeout);
        client.set_read_timeout(config_.read_timeout);
        client.set_follow_location(true);

        auto res = client.Get(path);
        if (!res) {
            return NetworkError(absl::StrCat(
                "Failed to fetch model pricing from ", Name(), ": ",
                httplib::to_string(res.error())));
        }
        if (res->status < 200 || res->status >= 300) {
            return NetworkError(absl::StrCat(
                "Failed to fetch pricing data: HTTP ", res->status, " ",
                httplib::status_message(res->status)));
        }

        TOKENLEDGER_LOG_DEBUG("Fetched {} bytes of pricing data from {}",
                              res->body.size(), config_.url);
        return std::move(res->body);

    } catch (const std::exception& e) {
        return NetworkError(absl::StrCat("Failed to fetch model pricing: ", e.what()));
    }
}

absl::StatusOr<std::string> PricingCatalogSource::ReadLocalFile() {
    std::ifstream in(config_.url, std::ios::binary);
    if (!in) {
        return NotFoundError(absl::StrCat("Pricing file not found: ", config_.url));
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return NetworkError(absl::StrCat("Failed to read pricing file: ", config_.url));
    }
    return contents.str();
}

}  // namespace tokenledger::pricing
