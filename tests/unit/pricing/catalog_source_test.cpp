/// @file catalog_source_test.cpp
/// @brief Tests for the remote catalog source against a local HTTP server

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <thread>

#include <httplib.h>

#include "pricing/catalog_source.h"

namespace tokenledger::pricing {
namespace {

constexpr char kLiteLLMBody[] = R"({
    "claude-sonnet-4-20250514": {
        "input_cost_per_token": 3e-06,
        "output_cost_per_token": 1.5e-05,
        "input_cost_per_token_above_200k_tokens": 6e-06,
        "max_input_tokens": 1000000
    },
    "bad-entry": {"input_cost_per_token": "three"},
    "gpt-5": {"input_cost_per_token": 1.25e-06, "output_cost_per_token": 1e-05}
})";

class CatalogSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Get("/prices.json", [this](const httplib::Request&, httplib::Response& res) {
            hits_.fetch_add(1);
            std::lock_guard<std::mutex> lock(mutex_);
            res.status = status_;
            res.set_content(body_, "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        server_thread_ = std::thread([this]() { server_.listen_after_bind(); });

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!server_.is_running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT_TRUE(server_.is_running());
    }

    void TearDown() override {
        server_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

    void Respond(int status, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
        body_ = std::move(body);
    }

    CatalogSourceConfig ConfigFor(const std::string& path = "/prices.json") const {
        CatalogSourceConfig config;
        config.url = "http://127.0.0.1:" + std::to_string(port_) + path;
        config.connection_timeout = std::chrono::seconds(2);
        config.read_timeout = std::chrono::seconds(2);
        return config;
    }

    httplib::Server server_;
    std::thread server_thread_;
    int port_ = 0;
    std::atomic<int> hits_{0};

    std::mutex mutex_;
    int status_ = 200;
    std::string body_ = kLiteLLMBody;
};

TEST_F(CatalogSourceTest, LoadsAndValidatesCatalog) {
    PricingCatalogSource source(ConfigFor());

    auto catalog = source.Load();
    ASSERT_TRUE(catalog.ok()) << catalog.status();
    EXPECT_EQ(catalog->size(), 2u);
    EXPECT_FALSE(catalog->Contains("bad-entry"));

    const auto* sonnet = catalog->Find("claude-sonnet-4-20250514");
    ASSERT_NE(sonnet, nullptr);
    EXPECT_DOUBLE_EQ(sonnet->input_cost_per_token_above_threshold.value(), 6e-6);
    EXPECT_EQ(sonnet->max_input_tokens, 1000000);

    EXPECT_EQ(source.RequestCount(), 1);
    EXPECT_EQ(hits_.load(), 1);
}

TEST_F(CatalogSourceTest, EveryLoadFetchesAgain) {
    PricingCatalogSource source(ConfigFor());

    ASSERT_TRUE(source.Load().ok());
    ASSERT_TRUE(source.Load().ok());
    EXPECT_EQ(hits_.load(), 2);
    EXPECT_EQ(source.RequestCount(), 2);
}

TEST_F(CatalogSourceTest, NonSuccessStatusIsNetworkError) {
    Respond(503, "upstream unavailable");
    PricingCatalogSource source(ConfigFor());

    auto catalog = source.Load();
    EXPECT_TRUE(absl::IsUnavailable(catalog.status())) << catalog.status();
}

TEST_F(CatalogSourceTest, MissingPathIsNetworkError) {
    PricingCatalogSource source(ConfigFor("/missing.json"));
    EXPECT_TRUE(absl::IsUnavailable(source.Load().status()));
}

TEST_F(CatalogSourceTest, MalformedBodyIsParseError) {
    Respond(200, "<html>rate limited</html>");
    PricingCatalogSource source(ConfigFor());

    auto catalog = source.Load();
    EXPECT_TRUE(absl::IsDataLoss(catalog.status())) << catalog.status();
}

TEST_F(CatalogSourceTest, ReadsModelsDevFormat) {
    Respond(200, R"({"openai": {"id": "openai", "models": {
        "gpt-5": {"id": "gpt-5", "cost": {"input": 1.25, "output": 10}}}}})");

    auto config = ConfigFor();
    config.format = CatalogFormat::kModelsDev;
    PricingCatalogSource source(config);
    EXPECT_EQ(source.Name(), "models.dev");

    auto catalog = source.Load();
    ASSERT_TRUE(catalog.ok()) << catalog.status();
    ASSERT_NE(catalog->Find("openai/gpt-5"), nullptr);
    EXPECT_DOUBLE_EQ(catalog->Find("gpt-5")->input_cost_per_token.value(), 1.25e-6);
}

TEST(CatalogSourceConnectionTest, RefusedConnectionIsNetworkError) {
    // Bind and release a port so nothing is listening on it
    int port = 0;
    {
        httplib::Server probe;
        port = probe.bind_to_any_port("127.0.0.1");
    }
    ASSERT_GT(port, 0);

    CatalogSourceConfig config;
    config.url = "http://127.0.0.1:" + std::to_string(port) + "/prices.json";
    config.connection_timeout = std::chrono::seconds(1);
    PricingCatalogSource source(config);

    EXPECT_TRUE(absl::IsUnavailable(source.Load().status()));
    EXPECT_EQ(source.RequestCount(), 1);
}

TEST(CatalogSourceFileTest, ReadsLocalPriceList) {
    auto path = std::filesystem::temp_directory_path() /
                ("tokenledger_prices_" + std::to_string(std::random_device{}()) + ".json");
    {
        std::ofstream out(path);
        out << kLiteLLMBody;
    }

    CatalogSourceConfig config;
    config.url = path.string();
    PricingCatalogSource source(config);

    auto catalog = source.Load();
    std::filesystem::remove(path);
    ASSERT_TRUE(catalog.ok()) << catalog.status();
    EXPECT_EQ(catalog->size(), 2u);
}

TEST(CatalogSourceFileTest, MissingLocalFileIsNotFound) {
    CatalogSourceConfig config;
    config.url = "/nonexistent/tokenledger/prices.json";
    PricingCatalogSource source(config);
    EXPECT_TRUE(absl::IsNotFound(source.Load().status()));
}

// ============================================================================
// URL helpers
// ============================================================================

TEST(SplitUrlTest, SplitsHostAndPath) {
    auto parts = SplitUrl(kLiteLLMPricingUrl);
    ASSERT_TRUE(parts.ok());
    EXPECT_EQ(parts->first, "https://raw.githubusercontent.com");
    EXPECT_EQ(parts->second, "/BerriAI/litellm/main/model_prices_and_context_window.json");
}

TEST(SplitUrlTest, DefaultsPathToRoot) {
    auto parts = SplitUrl("http://localhost:8080");
    ASSERT_TRUE(parts.ok());
    EXPECT_EQ(parts->first, "http://localhost:8080");
    EXPECT_EQ(parts->second, "/");
}

TEST(SplitUrlTest, RejectsMalformedUrls) {
    EXPECT_FALSE(SplitUrl("raw.githubusercontent.com/prices.json").ok());
    EXPECT_FALSE(SplitUrl("https:///prices.json").ok());
    EXPECT_FALSE(SplitUrl("https://").ok());
}

TEST(IsHttpUrlTest, DetectsScheme) {
    EXPECT_TRUE(IsHttpUrl("https://models.dev/api.json"));
    EXPECT_TRUE(IsHttpUrl("http://localhost/prices.json"));
    EXPECT_FALSE(IsHttpUrl("/var/lib/prices.json"));
    EXPECT_FALSE(IsHttpUrl("file:///var/lib/prices.json"));
}

}  // namespace
}  // namespace tokenledger::pricing
