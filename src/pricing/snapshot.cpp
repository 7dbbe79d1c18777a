#include "pricing/snapshot.h"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "common/logging.h"
#include "pricing/schema.h"

namespace tokenledger::pricing {

namespace fs = std::filesystem;

PricingCatalog FilterCatalog(const PricingCatalog& catalog, const CatalogPredicate& predicate) {
    PricingCatalog filtered;
    for (const auto& [model_name, entry] : catalog) {
        if (predicate(model_name, entry)) {
            filtered.Insert(model_name, entry);
        }
    }
    return filtered;
}

CatalogPredicate KeyPrefixFilter(std::vector<std::string> prefixes) {
    return [prefixes = std::move(prefixes)](const std::string& model_name,
                                            const ModelPricingEntry&) {
        if (prefixes.empty()) {
            return true;
        }
        return std::any_of(prefixes.begin(), prefixes.end(), [&](const std::string& prefix) {
            return absl::StartsWith(model_name, prefix);
        });
    };
}

const std::vector<std::string>& ClaudeSnapshotPrefixes() {
    static const std::vector<std::string> kPrefixes = {
        "claude-",
        "anthropic.claude-",
        "anthropic/claude-",
    };
    return kPrefixes;
}

absl::Status WriteSnapshot(const PricingCatalog& catalog, const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return absl::InternalError(absl::StrCat(
                "Failed to create directory ", path.parent_path().string(), ": ", ec.message()));
        }
    }

    fs::path tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return absl::InternalError(absl::StrCat("Cannot write ", tmp_path.string()));
        }
        out << CatalogToJson(catalog).dump(2) << '\n';
        out.close();
        if (!out) {
            return absl::InternalError(absl::StrCat("Failed writing ", tmp_path.string()));
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(tmp_path, ec);
        return absl::InternalError(absl::StrCat(
            "Failed to move snapshot into place at ", path.string(), ": ", reason));
    }

    TOKENLEDGER_LOG_INFO("Wrote pricing snapshot with {} models to {}",
                         catalog.size(), path.string());
    return absl::OkStatus();
}

}  // namespace tokenledger::pricing
