/// @file usage_pricer_test.cpp
/// @brief Tests for batch pricing of usage records

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>
#include <string>
#include <vector>

#include "pricing/usage_pricer.h"

namespace tokenledger::pricing {
namespace {

using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;

class StubCatalogProvider : public CatalogProvider {
public:
    MOCK_METHOD(absl::StatusOr<PricingCatalog>, Load, (), (override));
    MOCK_METHOD(std::string, Name, (), (const, override));
};

PricingCatalog TestCatalog() {
    PricingCatalog catalog;

    ModelPricingEntry sonnet;
    sonnet.input_cost_per_token = 3e-6;
    sonnet.output_cost_per_token = 1.5e-5;
    catalog.Insert("claude-sonnet-4-20250514", sonnet);

    ModelPricingEntry haiku;
    haiku.input_cost_per_token = 8e-7;
    haiku.output_cost_per_token = 4e-6;
    catalog.Insert("anthropic/claude-3-5-haiku-20241022", haiku);
    return catalog;
}

UsageRecord Record(std::string model, int64_t input, int64_t output) {
    UsageRecord record;
    record.model_name = std::move(model);
    record.tokens.input_tokens = input;
    record.tokens.output_tokens = output;
    return record;
}

class UsagePricerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto source = std::make_unique<NiceMock<StubCatalogProvider>>();
        source_ = source.get();
        fetcher_ = std::make_unique<PricingFetcher>(FetcherConfig{}, std::move(source), nullptr);
    }

    NiceMock<StubCatalogProvider>* source_ = nullptr;
    std::unique_ptr<PricingFetcher> fetcher_;
};

TEST_F(UsagePricerTest, PricesEachRecord) {
    EXPECT_CALL(*source_, Load()).WillOnce(Return(TestCatalog()));
    UsagePricer pricer(*fetcher_);

    auto priced = pricer.Price({
        Record("claude-sonnet-4-20250514", 1000, 500),
        Record("claude-3-5-haiku-20241022", 10000, 1000),
    });
    ASSERT_TRUE(priced.ok()) << priced.status();

    ASSERT_EQ(priced->record_costs.size(), 2u);
    EXPECT_NEAR(priced->record_costs[0], 0.0105, 1e-12);
    EXPECT_NEAR(priced->record_costs[1], 0.012, 1e-12);
    EXPECT_NEAR(priced->total_cost, 0.0225, 1e-12);
    EXPECT_EQ(priced->priced_records, 2);
    EXPECT_EQ(priced->unpriced_records, 0);
    EXPECT_TRUE(priced->unpriced_models.empty());
}

TEST_F(UsagePricerTest, UnknownModelsCountAsZero) {
    EXPECT_CALL(*source_, Load()).WillOnce(Return(TestCatalog()));
    UsagePricer pricer(*fetcher_);

    auto priced = pricer.Price({
        Record("zeta-model", 100, 100),
        Record("claude-sonnet-4-20250514", 1000, 0),
        Record("alpha-model", 100, 100),
        Record("zeta-model", 5, 5),
    });
    ASSERT_TRUE(priced.ok());

    EXPECT_DOUBLE_EQ(priced->record_costs[0], 0.0);
    EXPECT_DOUBLE_EQ(priced->record_costs[3], 0.0);
    EXPECT_NEAR(priced->total_cost, 0.003, 1e-12);
    EXPECT_EQ(priced->priced_records, 1);
    EXPECT_EQ(priced->unpriced_records, 3);
    EXPECT_THAT(priced->unpriced_models, ElementsAre("alpha-model", "zeta-model"));
}

TEST_F(UsagePricerTest, EmptyModelNameIsUnpriced) {
    EXPECT_CALL(*source_, Load()).WillOnce(Return(TestCatalog()));
    UsagePricer pricer(*fetcher_);

    auto priced = pricer.Price({Record("", 1000, 1000)});
    ASSERT_TRUE(priced.ok());
    EXPECT_DOUBLE_EQ(priced->total_cost, 0.0);
    EXPECT_EQ(priced->unpriced_records, 1);
    EXPECT_TRUE(priced->unpriced_models.empty());
}

TEST_F(UsagePricerTest, EmptyBatch) {
    EXPECT_CALL(*source_, Load()).WillOnce(Return(TestCatalog()));
    UsagePricer pricer(*fetcher_);

    auto priced = pricer.Price({});
    ASSERT_TRUE(priced.ok());
    EXPECT_TRUE(priced->record_costs.empty());
    EXPECT_DOUBLE_EQ(priced->total_cost, 0.0);
}

TEST_F(UsagePricerTest, FailsWhenCatalogUnavailable) {
    EXPECT_CALL(*source_, Load())
        .WillOnce(Return(absl::StatusOr<PricingCatalog>(absl::UnavailableError("down"))));
    UsagePricer pricer(*fetcher_);

    auto priced = pricer.Price({Record("claude-sonnet-4-20250514", 1, 1)});
    EXPECT_TRUE(absl::IsUnavailable(priced.status()));
}

}  // namespace
}  // namespace tokenledger::pricing
