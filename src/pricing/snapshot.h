#pragma once

/// @file snapshot.h
/// @brief Building and writing offline pricing snapshots

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <absl/status/status.h>

#include "pricing/catalog.h"

namespace tokenledger::pricing {

using CatalogPredicate =
    std::function<bool(const std::string& model_name, const ModelPricingEntry& entry)>;

/// @brief Copy the entries accepted by `predicate`, keeping their order
PricingCatalog FilterCatalog(const PricingCatalog& catalog, const CatalogPredicate& predicate);

/// @brief Predicate accepting keys that start with any of `prefixes`
/// (every key when the list is empty)
CatalogPredicate KeyPrefixFilter(std::vector<std::string> prefixes);

/// @brief Key prefixes of the Claude model family
const std::vector<std::string>& ClaudeSnapshotPrefixes();

/// @brief Write the catalog as a LiteLLM-style JSON file
///
/// The file is written next to the destination and renamed into place, so a
/// reader never sees a partial snapshot. Parent directories are created.
absl::Status WriteSnapshot(const PricingCatalog& catalog, const std::filesystem::path& path);

}  // namespace tokenledger::pricing
