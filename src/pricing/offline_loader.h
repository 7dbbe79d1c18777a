#pragma once

/// @file offline_loader.h
/// @brief Pricing catalog from a local snapshot file, without network access

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "pricing/catalog_provider.h"

namespace tokenledger::pricing {

/// File name of the bundled snapshot
inline constexpr char kSnapshotFileName[] = "pricing_snapshot.json";

/// @brief Loads a LiteLLM-style snapshot from the first usable candidate path
class OfflineSnapshotLoader : public CatalogProvider {
public:
    /// @param candidate_paths Paths tried in order
    explicit OfflineSnapshotLoader(std::vector<std::filesystem::path> candidate_paths);

    /// @brief Loader over `preferred` followed by the default candidate paths
    static OfflineSnapshotLoader WithDefaultPaths(
        std::vector<std::filesystem::path> preferred = {});

    /// @brief The bundled snapshot locations, in lookup order:
    /// next to the executable, the installed share directory, then the
    /// working directory
    static std::vector<std::filesystem::path> DefaultCandidatePaths();

    /// @brief Read the first candidate that exists and parses
    /// @return NotFound when no candidate yields a catalog
    absl::StatusOr<PricingCatalog> Load() override;

    std::string Name() const override { return "offline snapshot"; }

    const std::vector<std::filesystem::path>& CandidatePaths() const {
        return candidate_paths_;
    }

    /// @brief Path the last successful Load() read from
    const std::optional<std::filesystem::path>& LoadedFrom() const { return loaded_from_; }

private:
    std::vector<std::filesystem::path> candidate_paths_;
    std::optional<std::filesystem::path> loaded_from_;
};

/// @brief Directory containing the running executable, when it can be determined
std::optional<std::filesystem::path> ExecutableDirectory();

}  // namespace tokenledger::pricing
