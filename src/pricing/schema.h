#pragma once

/// @file schema.h
/// @brief Validation of catalog documents into pricing entries

#include <optional>
#include <string_view>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "pricing/catalog.h"

namespace tokenledger::pricing {

/// @brief Layout of a remote or local catalog document
enum class CatalogFormat {
    kLiteLLM,    ///< Flat object keyed by model name, USD per token
    kModelsDev   ///< models.dev api.json: providers -> models, USD per million tokens
};

/// @brief Parse a format name ("litellm" or "models_dev")
absl::StatusOr<CatalogFormat> ParseCatalogFormat(std::string_view name);

/// @brief Validate one LiteLLM-style entry
///
/// The value must be an object. Each known field, when present, must be a JSON
/// number; unknown fields are ignored.
/// @return The entry, or std::nullopt when the value violates the schema
std::optional<ModelPricingEntry> ValidatePricingEntry(const nlohmann::ordered_json& value);

/// @brief Keep the entries of a LiteLLM-style object that pass validation
PricingCatalog FilterValidEntries(const nlohmann::ordered_json& document);

/// @brief Parse a LiteLLM-style catalog body
/// @return ParseError when the body is not a JSON object
absl::StatusOr<PricingCatalog> ParseLiteLLMCatalog(std::string_view body);

/// @brief Parse a models.dev api.json body into per-token entries
///
/// Each model is stored under both "provider/model" and the bare model id.
/// @return ParseError when the body is not a JSON object
absl::StatusOr<PricingCatalog> ParseModelsDevCatalog(std::string_view body);

/// @brief Parse a body in the given format
absl::StatusOr<PricingCatalog> ParseCatalog(std::string_view body, CatalogFormat format);

/// @brief Serialize an entry using the LiteLLM field names, omitting absent fields
nlohmann::ordered_json PricingEntryToJson(const ModelPricingEntry& entry);

/// @brief Serialize a catalog as a LiteLLM-style object, preserving key order
nlohmann::ordered_json CatalogToJson(const PricingCatalog& catalog);

}  // namespace tokenledger::pricing
