/**
 * @file MarginAnalyzerTest.cpp
 * @brief Unit-тесты для MarginAnalyzer
 */

#include <gtest/gtest.h>
#include "application/MarginAnalyzer.hpp"
#include "adapters/secondary/persistence/InMemoryInventoryStore.hpp"
#include "../mocks/StoreSeeder.hpp"

using namespace inventory;
using namespace inventory::application;
using namespace inventory::tests;
using adapters::secondary::InMemoryInventoryStore;

class MarginAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryInventoryStore>();
        analyzer_ = std::make_shared<MarginAnalyzer>(store_);
        StoreSeeder(*store_).seed("store-1", "p1", 100, "250", "2.50",
                                  {{50, "2.00", 7200}, {50, "3.00", 3600}});
    }

    std::shared_ptr<InMemoryInventoryStore> store_;
    std::shared_ptr<MarginAnalyzer> analyzer_;
};

TEST_F(MarginAnalyzerTest, PriceBelowNewestLayer_FlagsLoss) {
    auto analysis = analyzer_->analyzeMargin("store-1", "p1", domain::Money::fromString("2.50"));

    EXPECT_EQ(analysis.layersAtLoss, 1);
    EXPECT_EQ(analysis.quantityAtLoss, 50);
    EXPECT_EQ(analysis.recommendedMinPrice, domain::Money::fromUnits(3));
    EXPECT_EQ(analysis.totalQuantity, 100);
    EXPECT_EQ(analysis.totalCost, domain::Money::fromUnits(250));
    EXPECT_EQ(analysis.weightedAverageCost, domain::Money::fromString("2.50"));
    EXPECT_TRUE(analysis.averageMargin.isZero());
    EXPECT_TRUE(analysis.potentialProfit.isZero());

    ASSERT_EQ(analysis.layers.size(), 2u);
    EXPECT_FALSE(analysis.layers[0].wouldLoseMoney);
    EXPECT_DOUBLE_EQ(analysis.layers[0].marginPercent, 20.0);
    EXPECT_TRUE(analysis.layers[1].wouldLoseMoney);
    EXPECT_EQ(analysis.layers[1].margin, domain::Money::fromString("-0.50"));
}

TEST_F(MarginAnalyzerTest, PriceAboveAllLayers_NoLoss) {
    auto analysis = analyzer_->analyzeMargin("store-1", "p1", domain::Money::fromUnits(4));

    EXPECT_EQ(analysis.layersAtLoss, 0);
    EXPECT_EQ(analysis.potentialRevenue, domain::Money::fromUnits(400));
    EXPECT_EQ(analysis.potentialProfit, domain::Money::fromUnits(150));
}

TEST_F(MarginAnalyzerTest, NoLayers_EmptyAnalysis) {
    auto analysis = analyzer_->analyzeMargin("store-1", "ghost", domain::Money::fromUnits(1));

    EXPECT_TRUE(analysis.layers.empty());
    EXPECT_EQ(analysis.totalQuantity, 0);
    EXPECT_TRUE(analysis.recommendedMinPrice.isZero());
}

TEST_F(MarginAnalyzerTest, NegativePrice_Throws) {
    EXPECT_THROW(analyzer_->analyzeMargin("store-1", "p1", domain::Money::fromUnits(-1)),
                 domain::ValidationError);
}
