#include "pricing/offline_loader.h"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "pricing/schema.h"

namespace tokenledger::pricing {

namespace fs = std::filesystem;

std::optional<fs::path> ExecutableDirectory() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return std::nullopt;
    }
    return exe.parent_path();
}

OfflineSnapshotLoader::OfflineSnapshotLoader(std::vector<fs::path> candidate_paths)
    : candidate_paths_(std::move(candidate_paths)) {}

OfflineSnapshotLoader OfflineSnapshotLoader::WithDefaultPaths(std::vector<fs::path> preferred) {
    for (auto& path : DefaultCandidatePaths()) {
        preferred.push_back(std::move(path));
    }
    return OfflineSnapshotLoader(std::move(preferred));
}

std::vector<fs::path> OfflineSnapshotLoader::DefaultCandidatePaths() {
    std::vector<fs::path> paths;

    if (auto exe_dir = ExecutableDirectory()) {
        paths.push_back(*exe_dir / kSnapshotFileName);
        paths.push_back(*exe_dir / ".." / "share" / "tokenledger" / kSnapshotFileName);
    }

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / "data" / kSnapshotFileName);
        paths.push_back(cwd / kSnapshotFileName);
    }
    return paths;
}

absl::StatusOr<PricingCatalog> OfflineSnapshotLoader::Load() {
    loaded_from_.reset();

    for (const auto& path : candidate_paths_) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            TOKENLEDGER_LOG_DEBUG("No pricing snapshot at {}", path.string());
            continue;
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            TOKENLEDGER_LOG_WARN("Cannot open pricing snapshot {}", path.string());
            continue;
        }
        std::ostringstream contents;
        contents << in.rdbuf();

        auto catalog = ParseLiteLLMCatalog(contents.str());
        if (!catalog.ok()) {
            TOKENLEDGER_LOG_WARN("Ignoring pricing snapshot {}: {}",
                                 path.string(), catalog.status().message());
            continue;
        }

        loaded_from_ = path;
        TOKENLEDGER_LOG_INFO("Using cached pricing data for {} models from {}",
                             catalog->size(), path.string());
        return catalog;
    }

    return NotFoundError(absl::StrCat(
        "No offline pricing snapshot found in ", candidate_paths_.size(),
        " candidate locations"));
}

}  // namespace tokenledger::pricing
