#include "pricing/schema.h"

#include <cmath>
#include <cstdint>
#include <string>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace tokenledger::pricing {

using json = nlohmann::ordered_json;

namespace {

struct RateField {
    const char* name;
    std::optional<double> ModelPricingEntry::*member;
};

struct LimitField {
    const char* name;
    std::optional<int64_t> ModelPricingEntry::*member;
};

// Wire names of the LiteLLM catalog; the tiered fields are published for a 200k threshold
constexpr RateField kRateFields[] = {
    {"input_cost_per_token", &ModelPricingEntry::input_cost_per_token},
    {"output_cost_per_token", &ModelPricingEntry::output_cost_per_token},
    {"cache_creation_input_token_cost", &ModelPricingEntry::cache_creation_input_token_cost},
    {"cache_read_input_token_cost", &ModelPricingEntry::cache_read_input_token_cost},
    {"input_cost_per_token_above_200k_tokens",
     &ModelPricingEntry::input_cost_per_token_above_threshold},
    {"output_cost_per_token_above_200k_tokens",
     &ModelPricingEntry::output_cost_per_token_above_threshold},
    {"cache_creation_input_token_cost_above_200k_tokens",
     &ModelPricingEntry::cache_creation_input_token_cost_above_threshold},
    {"cache_read_input_token_cost_above_200k_tokens",
     &ModelPricingEntry::cache_read_input_token_cost_above_threshold},
};

constexpr LimitField kLimitFields[] = {
    {"max_tokens", &ModelPricingEntry::max_tokens},
    {"max_input_tokens", &ModelPricingEntry::max_input_tokens},
    {"max_output_tokens", &ModelPricingEntry::max_output_tokens},
};

constexpr double kTokensPerMillion = 1000000.0;

int64_t ToTokenCount(const json& value) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    return static_cast<int64_t>(std::llround(value.get<double>()));
}

absl::StatusOr<json> ParseDocument(std::string_view body) {
    json document = json::parse(body.begin(), body.end(), nullptr, false);
    if (document.is_discarded()) {
        return ParseError("Failed to parse pricing data: body is not valid JSON");
    }
    if (!document.is_object()) {
        return ParseError(absl::StrCat(
            "Failed to parse pricing data: expected a JSON object, got ",
            document.type_name()));
    }
    return document;
}

/// Optional numeric member of a models.dev object; false when present but not a number
bool ReadOptionalNumber(const json& object, const char* key, std::optional<double>& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return true;
    }
    if (!it->is_number()) {
        return false;
    }
    out = it->get<double>();
    return true;
}

std::optional<double> PerMillionToPerToken(std::optional<double> per_million) {
    if (!per_million.has_value()) {
        return std::nullopt;
    }
    return *per_million / kTokensPerMillion;
}

std::optional<ModelPricingEntry> ConvertModelsDevModel(const json& model) {
    if (!model.is_object()) {
        return std::nullopt;
    }
    auto id = model.find("id");
    if (id == model.end() || !id->is_string()) {
        return std::nullopt;
    }

    std::optional<double> input, output, cache_read, cache_write;
    if (auto cost = model.find("cost"); cost != model.end()) {
        if (!cost->is_object() ||
            !ReadOptionalNumber(*cost, "input", input) ||
            !ReadOptionalNumber(*cost, "output", output) ||
            !ReadOptionalNumber(*cost, "cache_read", cache_read) ||
            !ReadOptionalNumber(*cost, "cache_write", cache_write)) {
            return std::nullopt;
        }
    }

    std::optional<double> context, output_limit;
    if (auto limit = model.find("limit"); limit != model.end()) {
        if (!limit->is_object() ||
            !ReadOptionalNumber(*limit, "context", context) ||
            !ReadOptionalNumber(*limit, "output", output_limit)) {
            return std::nullopt;
        }
    }

    ModelPricingEntry entry;
    entry.input_cost_per_token = PerMillionToPerToken(input);
    entry.output_cost_per_token = PerMillionToPerToken(output);
    entry.cache_read_input_token_cost = PerMillionToPerToken(cache_read);
    entry.cache_creation_input_token_cost = PerMillionToPerToken(cache_write);
    if (context.has_value()) {
        entry.max_input_tokens = static_cast<int64_t>(std::llround(*context));
        entry.max_tokens = entry.max_input_tokens;
    }
    if (output_limit.has_value()) {
        entry.max_output_tokens = static_cast<int64_t>(std::llround(*output_limit));
    }
    return entry;
}

}  // namespace

absl::StatusOr<CatalogFormat> ParseCatalogFormat(std::string_view name) {
    const std::string format = absl::AsciiStrToLower(name);
    if (format == "litellm") {
        return CatalogFormat::kLiteLLM;
    }
    if (format == "models_dev" || format == "models.dev" || format == "modelsdev") {
        return CatalogFormat::kModelsDev;
    }
    return absl::InvalidArgumentError(absl::StrCat("Unknown catalog format: ", name));
}

std::optional<ModelPricingEntry> ValidatePricingEntry(const json& value) {
    if (!value.is_object()) {
        return std::nullopt;
    }

    ModelPricingEntry entry;
    for (const auto& field : kRateFields) {
        auto it = value.find(field.name);
        if (it == value.end()) {
            continue;
        }
        if (!it->is_number()) {
            return std::nullopt;
        }
        entry.*field.member = it->get<double>();
    }
    for (const auto& field : kLimitFields) {
        auto it = value.find(field.name);
        if (it == value.end()) {
            continue;
        }
        if (!it->is_number()) {
            return std::nullopt;
        }
        entry.*field.member = ToTokenCount(*it);
    }
    return entry;
}

PricingCatalog FilterValidEntries(const json& document) {
    PricingCatalog catalog;
    size_t skipped = 0;

    for (const auto& [model_name, value] : document.items()) {
        auto entry = ValidatePricingEntry(value);
        if (!entry.has_value()) {
            TOKENLEDGER_LOG_TRACE("Skipping pricing entry '{}': schema mismatch", model_name);
            ++skipped;
            continue;
        }
        catalog.Insert(model_name, std::move(*entry));
    }

    if (skipped > 0) {
        TOKENLEDGER_LOG_DEBUG("Skipped {} pricing entries that failed validation", skipped);
    }
    return catalog;
}

absl::StatusOr<PricingCatalog> ParseLiteLLMCatalog(std::string_view body) {
    TOKENLEDGER_ASSIGN_OR_RETURN(json document, ParseDocument(body));
    return FilterValidEntries(document);
}

absl::StatusOr<PricingCatalog> ParseModelsDevCatalog(std::string_view body) {
    TOKENLEDGER_ASSIGN_OR_RETURN(json document, ParseDocument(body));

    PricingCatalog catalog;
    size_t skipped = 0;

    for (const auto& [provider_id, provider] : document.items()) {
        if (!provider.is_object()) {
            ++skipped;
            continue;
        }
        auto id = provider.find("id");
        if (id == provider.end() || !id->is_string()) {
            ++skipped;
            continue;
        }
        auto models = provider.find("models");
        if (models == provider.end()) {
            continue;
        }
        if (!models->is_object()) {
            ++skipped;
            continue;
        }

        for (const auto& [model_id, model] : models->items()) {
            auto entry = ConvertModelsDevModel(model);
            if (!entry.has_value()) {
                ++skipped;
                continue;
            }
            catalog.Insert(absl::StrCat(provider_id, "/", model_id), *entry);
            catalog.Insert(model_id, std::move(*entry));
        }
    }

    if (skipped > 0) {
        TOKENLEDGER_LOG_DEBUG("Skipped {} models.dev records that failed validation", skipped);
    }
    return catalog;
}

absl::StatusOr<PricingCatalog> ParseCatalog(std::string_view body, CatalogFormat format) {
    switch (format) {
        case CatalogFormat::kModelsDev:
            return ParseModelsDevCatalog(body);
        case CatalogFormat::kLiteLLM:
        default:
            return ParseLiteLLMCatalog(body);
    }
}

json PricingEntryToJson(const ModelPricingEntry& entry) {
    json out = json::object();
    for (const auto& field : kRateFields) {
        if (const auto& rate = entry.*field.member) {
            out[field.name] = *rate;
        }
    }
    for (const auto& field : kLimitFields) {
        if (const auto& limit = entry.*field.member) {
            out[field.name] = *limit;
        }
    }
    return out;
}

json CatalogToJson(const PricingCatalog& catalog) {
    json out = json::object();
    for (const auto& [model_name, entry] : catalog) {
        out[model_name] = PricingEntryToJson(entry);
    }
    return out;
}

}  // namespace tokenledger::pricing
