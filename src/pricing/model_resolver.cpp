#include "pricing/model_resolver.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

namespace tokenledger::pricing {

const std::vector<std::string>& DefaultProviderPrefixes() {
    static const std::vector<std::string> kPrefixes = {
        "anthropic/",
        "claude-3-5-",
        "claude-3-",
        "claude-",
        "openai/",
        "azure/",
        "openrouter/openai/",
    };
    return kPrefixes;
}

const std::vector<std::string>& ClaudeProviderPrefixes() {
    static const std::vector<std::string> kPrefixes = {
        "anthropic/",
        "claude-3-5-",
        "claude-3-",
        "claude-",
        "openrouter/openai/",
    };
    return kPrefixes;
}

const std::vector<std::string>& CodexProviderPrefixes() {
    static const std::vector<std::string> kPrefixes = {
        "openai/",
        "azure/",
        "openrouter/openai/",
    };
    return kPrefixes;
}

absl::StatusOr<std::vector<std::string>> ProviderPrefixPreset(std::string_view name) {
    const std::string preset = absl::AsciiStrToLower(name);
    if (preset == "default") {
        return DefaultProviderPrefixes();
    }
    if (preset == "claude") {
        return ClaudeProviderPrefixes();
    }
    if (preset == "codex") {
        return CodexProviderPrefixes();
    }
    return absl::InvalidArgumentError(
        absl::StrCat("Unknown provider prefix preset: ", name));
}

std::vector<std::string> BuildCandidates(std::string_view model_name,
                                         const std::vector<std::string>& prefixes) {
    std::vector<std::string> candidates;
    candidates.reserve(prefixes.size() + 1);
    candidates.emplace_back(model_name);

    for (const auto& prefix : prefixes) {
        std::string candidate = absl::StrCat(prefix, model_name);
        if (std::find(candidates.begin(), candidates.end(), candidate) == candidates.end()) {
            candidates.push_back(std::move(candidate));
        }
    }
    return candidates;
}

std::optional<ResolvedModel> Resolve(const PricingCatalog& catalog,
                                     std::string_view model_name,
                                     const std::vector<std::string>& prefixes) {
    if (model_name.empty() || catalog.empty()) {
        return std::nullopt;
    }

    const auto candidates = BuildCandidates(model_name, prefixes);
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (const auto* entry = catalog.Find(candidates[i])) {
            return ResolvedModel{
                .catalog_key = candidates[i],
                .pricing = *entry,
                .match = i == 0 ? MatchKind::kExact : MatchKind::kPrefixed,
            };
        }
    }

    const std::string lowered = absl::AsciiStrToLower(model_name);
    for (const auto& [key, entry] : catalog) {
        if (key.empty()) {
            continue;
        }
        const std::string comparison = absl::AsciiStrToLower(key);
        if (absl::StrContains(comparison, lowered) || absl::StrContains(lowered, comparison)) {
            return ResolvedModel{
                .catalog_key = key,
                .pricing = entry,
                .match = MatchKind::kSubstring,
            };
        }
    }

    return std::nullopt;
}

std::optional<ResolvedModel> Resolve(const PricingCatalog& catalog,
                                     std::string_view model_name) {
    return Resolve(catalog, model_name, DefaultProviderPrefixes());
}

}  // namespace tokenledger::pricing
