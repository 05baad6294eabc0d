/**
 * @file FifoCostCalculatorTest.cpp
 * @brief Unit-тесты для FifoCostCalculator
 */

#include <gtest/gtest.h>
#include "domain/FifoCostCalculator.hpp"
#include "domain/errors/InventoryErrors.hpp"

using namespace inventory::domain;

namespace {

CostLayer makeLayer(const std::string& id, int64_t qty, const std::string& unitCost,
                    int64_t createdAtSeconds, int64_t sequence) {
    CostLayer layer;
    layer.id = id;
    layer.storeId = "store-1";
    layer.productId = "prod-1";
    layer.quantityRemaining = qty;
    layer.unitCost = Money::fromString(unitCost);
    layer.source = "purchase";
    layer.createdAt = Timestamp::fromUnixSeconds(createdAtSeconds);
    layer.sequence = sequence;
    return layer;
}

FallbackCostProvider noFallback() {
    return []() { return Money(); };
}

} // namespace

class FifoCostCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        layers_ = {
            makeLayer("L1", 50, "2.00", 1000, 1),
            makeLayer("L2", 50, "3.00", 2000, 2)
        };
    }

    std::vector<CostLayer> layers_;
};

// ============================================================================
// CONSUME
// ============================================================================

TEST_F(FifoCostCalculatorTest, Consume_OldestLayerFirst) {
    auto result = FifoCostCalculator::consume(layers_, 60, noFallback());

    EXPECT_EQ(result.requestedQuantity, 60);
    EXPECT_EQ(result.totalCost, Money::fromUnits(130));
    EXPECT_EQ(result.coveredByLayers, 60);
    EXPECT_EQ(result.shortfallQuantity, 0);

    ASSERT_EQ(result.slices.size(), 2u);
    EXPECT_EQ(result.slices[0].layerId, "L1");
    EXPECT_EQ(result.slices[0].quantity, 50);
    EXPECT_EQ(result.slices[0].cost, Money::fromUnits(100));
    EXPECT_EQ(result.slices[1].layerId, "L2");
    EXPECT_EQ(result.slices[1].quantity, 10);

    ASSERT_EQ(layers_.size(), 1u);
    EXPECT_EQ(layers_[0].id, "L2");
    EXPECT_EQ(layers_[0].quantityRemaining, 40);
    EXPECT_EQ(layers_[0].unitCost, Money::fromUnits(3));
}

TEST_F(FifoCostCalculatorTest, Consume_OneUnitIntoSecondLayerLeavesThirdUntouched) {
    layers_.push_back(makeLayer("L3", 20, "5.00", 3000, 3));

    auto result = FifoCostCalculator::consume(layers_, 51, noFallback());

    EXPECT_EQ(result.totalCost, Money::fromUnits(103));
    ASSERT_EQ(result.slices.size(), 2u);
    EXPECT_EQ(result.slices[0].layerId, "L1");
    EXPECT_EQ(result.slices[0].quantity, 50);
    EXPECT_EQ(result.slices[1].layerId, "L2");
    EXPECT_EQ(result.slices[1].quantity, 1);

    ASSERT_EQ(layers_.size(), 2u);
    EXPECT_EQ(layers_[0].id, "L2");
    EXPECT_EQ(layers_[0].quantityRemaining, 49);
    EXPECT_EQ(layers_[1].id, "L3");
    EXPECT_EQ(layers_[1].quantityRemaining, 20);
    EXPECT_EQ(layers_[1].unitCost, Money::fromUnits(5));
}

TEST_F(FifoCostCalculatorTest, Consume_ShortfallUsesFallbackCost) {
    int fallbackCalls = 0;
    auto fallback = [&fallbackCalls]() {
        ++fallbackCalls;
        return Money::fromString("4.00");
    };

    auto result = FifoCostCalculator::consume(layers_, 110, fallback);

    EXPECT_EQ(fallbackCalls, 1);
    EXPECT_EQ(result.coveredByLayers, 100);
    EXPECT_EQ(result.shortfallQuantity, 10);
    EXPECT_EQ(result.fallbackUnitCost, Money::fromUnits(4));
    EXPECT_EQ(result.totalCost, Money::fromUnits(290));
    EXPECT_TRUE(layers_.empty());
}

TEST_F(FifoCostCalculatorTest, Consume_FallbackNotCalledWhenCovered) {
    bool called = false;
    FifoCostCalculator::consume(layers_, 10, [&called]() {
        called = true;
        return Money::fromUnits(9);
    });
    EXPECT_FALSE(called);
}

TEST_F(FifoCostCalculatorTest, Consume_NegativeFallbackTreatedAsZero) {
    std::vector<CostLayer> empty;
    auto result = FifoCostCalculator::consume(empty, 5, []() { return Money::fromUnits(-1); });

    EXPECT_EQ(result.shortfallQuantity, 5);
    EXPECT_TRUE(result.totalCost.isZero());
}

TEST_F(FifoCostCalculatorTest, Consume_RejectsNonPositiveQuantity) {
    EXPECT_THROW(FifoCostCalculator::consume(layers_, 0, noFallback()), ValidationError);
    EXPECT_THROW(FifoCostCalculator::consume(layers_, -3, noFallback()), ValidationError);
    EXPECT_EQ(FifoCostCalculator::totalQuantity(layers_), 100);
}

// ============================================================================
// PREVIEW
// ============================================================================

TEST_F(FifoCostCalculatorTest, Preview_MatchesConsumeWithoutMutation) {
    auto preview = FifoCostCalculator::preview(layers_, 60, noFallback());
    EXPECT_EQ(FifoCostCalculator::totalQuantity(layers_), 100);

    auto consumed = FifoCostCalculator::consume(layers_, 60, noFallback());
    EXPECT_EQ(preview.totalCost, consumed.totalCost);
    EXPECT_EQ(preview.slices.size(), consumed.slices.size());
}

// ============================================================================
// ORDERING AND TOTALS
// ============================================================================

TEST_F(FifoCostCalculatorTest, SortFifo_TieOnCreatedAtBrokenBySequence) {
    std::vector<CostLayer> layers = {
        makeLayer("late", 1, "5.00", 3000, 1),
        makeLayer("second", 1, "2.00", 1000, 7),
        makeLayer("first", 1, "1.00", 1000, 3)
    };

    FifoCostCalculator::sortFifo(layers);

    EXPECT_EQ(layers[0].id, "first");
    EXPECT_EQ(layers[1].id, "second");
    EXPECT_EQ(layers[2].id, "late");
}

TEST_F(FifoCostCalculatorTest, TotalValue_SumsRemainingValue) {
    EXPECT_EQ(FifoCostCalculator::totalValue(layers_), Money::fromUnits(250));
}
