/// @file main.cpp
/// @brief tokenledger-pricing entry point

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "common/config.h"
#include "common/logging.h"
#include "pricing/catalog_source.h"
#include "pricing/cost_calculator.h"
#include "pricing/fetcher.h"
#include "pricing/schema.h"
#include "pricing/snapshot.h"

namespace {

constexpr char kVersion[] = "tokenledger-pricing v1.0.0";

using tokenledger::pricing::MatchKind;

const char* MatchKindName(MatchKind kind) {
    switch (kind) {
        case MatchKind::kExact: return "exact";
        case MatchKind::kPrefixed: return "prefixed";
        case MatchKind::kSubstring: return "substring";
        default: return "unknown";
    }
}

int RunLookup(tokenledger::pricing::PricingFetcher& fetcher, const std::string& model) {
    auto resolved = fetcher.ResolveModel(model);
    if (!resolved.ok()) {
        TOKENLEDGER_LOG_ERROR("{}", resolved.status().message());
        return 1;
    }
    if (!resolved->has_value()) {
        std::cerr << "Model pricing not found for " << model << std::endl;
        return 1;
    }

    const auto& match = **resolved;
    const auto rates = tokenledger::pricing::ToPerMillionRates(match.pricing);

    nlohmann::ordered_json out;
    out["model"] = model;
    out["catalog_key"] = match.catalog_key;
    out["match"] = MatchKindName(match.match);
    out["pricing"] = tokenledger::pricing::PricingEntryToJson(match.pricing);
    out["per_million"] = {
        {"input", rates.input},
        {"output", rates.output},
        {"cached_input", rates.cached_input},
    };
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int RunCost(tokenledger::pricing::PricingFetcher& fetcher,
            const std::string& model,
            const tokenledger::pricing::TokenUsage& tokens) {
    auto resolved = fetcher.ResolveModel(model);
    if (!resolved.ok()) {
        TOKENLEDGER_LOG_ERROR("{}", resolved.status().message());
        return 1;
    }
    if (!resolved->has_value()) {
        TOKENLEDGER_LOG_WARN("Model pricing not found for {}", model);
        return 1;
    }

    const auto& pricing = (*resolved)->pricing;
    const auto breakdown = tokenledger::pricing::CalculateCostBreakdown(
        tokens, pricing, fetcher.GetConfig().tier_threshold);

    std::cout << std::fixed << std::setprecision(6)
              << "model:          " << (*resolved)->catalog_key << "\n"
              << "input:          $" << breakdown.input_cost << "\n"
              << "output:         $" << breakdown.output_cost << "\n"
              << "cache creation: $" << breakdown.cache_creation_cost << "\n"
              << "cache read:     $" << breakdown.cache_read_cost << "\n"
              << "total:          $" << fetcher.CalculateCostFromPricing(tokens, pricing)
              << std::endl;
    return 0;
}

int RunSnapshot(const tokenledger::pricing::FetcherConfig& config,
                const std::string& output,
                std::vector<std::string> prefixes,
                bool claude_only) {
    if (config.offline) {
        TOKENLEDGER_LOG_ERROR("Cannot build a pricing snapshot in offline mode");
        return 1;
    }

    tokenledger::pricing::PricingCatalogSource source(config.source);
    auto catalog = source.Load();
    if (!catalog.ok()) {
        TOKENLEDGER_LOG_ERROR("Failed to fetch pricing data: {}", catalog.status().message());
        return 1;
    }

    if (claude_only) {
        const auto& claude = tokenledger::pricing::ClaudeSnapshotPrefixes();
        prefixes.insert(prefixes.end(), claude.begin(), claude.end());
    }
    auto filtered = tokenledger::pricing::FilterCatalog(
        *catalog, tokenledger::pricing::KeyPrefixFilter(std::move(prefixes)));

    auto status = tokenledger::pricing::WriteSnapshot(filtered, output);
    if (!status.ok()) {
        TOKENLEDGER_LOG_ERROR("{}", status.message());
        return 1;
    }
    std::cout << "Wrote " << filtered.size() << " models to " << output << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"tokenledger-pricing - model pricing lookup and token cost calculation"};
    app.require_subcommand(0, 1);

    std::string config_path;
    std::string log_level;
    bool offline = false;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_flag("--offline", offline, "Use the local pricing snapshot only");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    auto* lookup = app.add_subcommand("lookup", "Resolve a model name and print its pricing");
    std::string lookup_model;
    lookup->add_option("model", lookup_model, "Model name as recorded in usage logs")->required();

    auto* cost = app.add_subcommand("cost", "Calculate the USD cost of token counts");
    std::string cost_model;
    tokenledger::pricing::TokenUsage tokens;
    cost->add_option("model", cost_model, "Model name as recorded in usage logs")->required();
    cost->add_option("--input", tokens.input_tokens, "Input tokens")
        ->check(CLI::NonNegativeNumber);
    cost->add_option("--output", tokens.output_tokens, "Output tokens")
        ->check(CLI::NonNegativeNumber);
    cost->add_option("--cache-creation", tokens.cache_creation_input_tokens,
                     "Cache creation input tokens")
        ->check(CLI::NonNegativeNumber);
    cost->add_option("--cache-read", tokens.cache_read_input_tokens, "Cache read input tokens")
        ->check(CLI::NonNegativeNumber);

    auto* snapshot = app.add_subcommand("snapshot", "Fetch the catalog and write an offline snapshot");
    std::string snapshot_output;
    std::vector<std::string> snapshot_prefixes;
    bool claude_only = false;
    snapshot->add_option("-o,--output", snapshot_output, "Snapshot file to write")->required();
    snapshot->add_option("--prefix", snapshot_prefixes,
                         "Keep only model names starting with this prefix (repeatable)");
    snapshot->add_flag("--claude", claude_only, "Keep only Claude models");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << kVersion << std::endl;
        return 0;
    }
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
        return 1;
    }

    std::optional<std::filesystem::path> config_file;
    if (!config_path.empty()) {
        config_file = config_path;
    }
    auto config = tokenledger::Config::LoadWithEnv(config_file);
    if (!config.ok()) {
        std::cerr << "Failed to load config: " << config.status().message() << std::endl;
        return 1;
    }

    // Initialize logging
    tokenledger::LogConfig log_config;
    log_config.name = "tokenledger-pricing";
    log_config.level = tokenledger::ParseLogLevel(
        log_level.empty() ? config->GetString("logging.level", "warn") : log_level);
    log_config.enable_file = config->HasKey("logging.file");
    if (log_config.enable_file) {
        log_config.file_path = config->GetString("logging.file");
    }
    tokenledger::InitLogging(log_config);

    auto fetcher_config = tokenledger::pricing::FetcherConfig::FromConfig(*config);
    if (!fetcher_config.ok()) {
        TOKENLEDGER_LOG_ERROR("Invalid pricing configuration: {}",
                              fetcher_config.status().message());
        return 1;
    }
    if (offline) {
        fetcher_config->offline = true;
    }

    int exit_code = 0;
    if (snapshot->parsed()) {
        exit_code = RunSnapshot(*fetcher_config, snapshot_output,
                                std::move(snapshot_prefixes), claude_only);
    } else {
        tokenledger::pricing::PricingFetcher fetcher(*fetcher_config);
        if (lookup->parsed()) {
            exit_code = RunLookup(fetcher, lookup_model);
        } else {
            exit_code = RunCost(fetcher, cost_model, tokens);
        }
    }

    tokenledger::ShutdownLogging();
    return exit_code;
}
