#pragma once

/// @file model_resolver.h
/// @brief Matching of free-form model names against a pricing catalog

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "pricing/catalog.h"

namespace tokenledger::pricing {

/// @brief How a model name was matched to a catalog key
enum class MatchKind {
    kExact,      ///< The name itself is a catalog key
    kPrefixed,   ///< A provider prefix plus the name is a catalog key
    kSubstring   ///< Case-insensitive containment in either direction
};

/// @brief Result of resolving a model name
struct ResolvedModel {
    std::string catalog_key;
    ModelPricingEntry pricing;
    MatchKind match = MatchKind::kExact;
};

/// @brief Prefixes tried when no other list is configured
const std::vector<std::string>& DefaultProviderPrefixes();

/// @brief Prefixes used for Claude usage logs
const std::vector<std::string>& ClaudeProviderPrefixes();

/// @brief Prefixes used for Codex/OpenAI usage logs
const std::vector<std::string>& CodexProviderPrefixes();

/// @brief Look up a prefix list by preset name ("default", "claude", "codex")
absl::StatusOr<std::vector<std::string>> ProviderPrefixPreset(std::string_view name);

/// @brief Candidate keys for a model name: the name, then each prefix + name,
/// without duplicates, in that order
std::vector<std::string> BuildCandidates(std::string_view model_name,
                                         const std::vector<std::string>& prefixes);

/// @brief Resolve a model name against a catalog
///
/// Exact and prefixed candidates are checked first, in candidate order. Only when
/// none of them is a key does the resolver fall back to a case-insensitive
/// substring scan over the catalog in its stored order. An empty name never
/// matches.
/// @return The matched key and entry, or std::nullopt when nothing matches
std::optional<ResolvedModel> Resolve(const PricingCatalog& catalog,
                                     std::string_view model_name,
                                     const std::vector<std::string>& prefixes);

/// @brief Resolve with the default provider prefixes
std::optional<ResolvedModel> Resolve(const PricingCatalog& catalog,
                                     std::string_view model_name);

}  // namespace tokenledger::pricing
