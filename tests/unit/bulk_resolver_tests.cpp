#include <gtest/gtest.h>
#include "oracle/bulk_resolver.hpp"
#include "common/reference_error.hpp"
#include "unit/test_stores.hpp"

#include <string>
#include <utility>
#include <vector>

class BulkResolverTest : public ::testing::Test {
protected:
  void SetUp() override { TestPrices::Populate(store); }

  MockPriceLookup store;
  BulkResolver resolver;
};

TEST_F(BulkResolverTest, ResolvesPairsInInputOrder) {
  auto out = resolver.Resolve({"BTC", "ETH"}, {"USD", "BTC"}, TestPrices::NOW, store);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(FixedPoint::ToDecimalString(out[0].rate), "23131270000000000000000");
  EXPECT_EQ(out[0].last_updated_base, TestPrices::BTC_TIME);
  EXPECT_EQ(out[0].last_updated_quote, TestPrices::NOW);
  // ETH/BTC cross rate, floor(price(ETH) * 1e18 / price(BTC))
  EXPECT_EQ(out[1].rate, FixedPoint::MulDiv(TestPrices::ETH, FixedPoint::SCALE, TestPrices::BTC));
  EXPECT_EQ(FixedPoint::ToDecimalString(out[1].rate), "70921311281222345");
  EXPECT_EQ(out[1].last_updated_base, TestPrices::ETH_TIME);
  EXPECT_EQ(out[1].last_updated_quote, TestPrices::BTC_TIME);
}

TEST_F(BulkResolverTest, EachEntryMatchesSingleResolution) {
  std::vector<std::string> bases = {"BAND", "USD", "ETH", "BTC", "BAND"};
  std::vector<std::string> quotes = {"ETH", "BAND", "ETH", "BAND", "USD"};
  auto out = resolver.Resolve(bases, quotes, TestPrices::NOW, store);
  ASSERT_EQ(out.size(), bases.size());
  for (size_t i = 0; i < bases.size(); ++i) {
    EXPECT_EQ(out[i], resolver.pair_resolver().Resolve(bases[i], quotes[i], TestPrices::NOW, store)) << i;
  }
}

TEST_F(BulkResolverTest, EmptyBatchIsEmpty) {
  EXPECT_TRUE(resolver.Resolve({}, {}, TestPrices::NOW, store).empty());
}

TEST_F(BulkResolverTest, LengthMismatchFailsBeforeAnyLookup) {
  try {
    resolver.Resolve({"BTC", "ETH"}, {"USD"}, TestPrices::NOW, store);
    FAIL() << "expected ReferenceError";
  } catch (const ReferenceError& e) {
    EXPECT_EQ(e.code(), ReferenceErrorCode::LengthMismatch);
    EXPECT_STREQ(e.what(), "NOT_ALL_INPUT_SIZES_ARE_THE_SAME");
    EXPECT_FALSE(e.pair_index().has_value());
  }
  EXPECT_EQ(store.lookups(), 0);
  EXPECT_THROW(resolver.Resolve({}, {"USD"}, TestPrices::NOW, store), ReferenceError);
}

TEST_F(BulkResolverTest, UnknownSymbolFailsWholeBatchWithPairIndex) {
  try {
    resolver.Resolve({"BTC", "ETH", "DOGE"}, {"USD", "USD", "USD"}, TestPrices::NOW, store);
    FAIL() << "expected ReferenceError";
  } catch (const ReferenceError& e) {
    EXPECT_EQ(e.code(), ReferenceErrorCode::SymbolNotFound);
    EXPECT_EQ(e.symbols(), std::vector<std::string>{"DOGE"});
    ASSERT_TRUE(e.pair_index().has_value());
    EXPECT_EQ(*e.pair_index(), 2u);
    EXPECT_STREQ(e.what(), "PAIR_2: DATA_NOT_AVAILABLE_FOR_DOGE");
  }
}

TEST_F(BulkResolverTest, FirstFailingPairWins) {
  store.Put("ZERO", 0, 1);
  try {
    resolver.Resolve({"BTC", "BTC", "NOPE"}, {"USD", "ZERO", "USD"}, TestPrices::NOW, store);
    FAIL() << "expected ReferenceError";
  } catch (const ReferenceError& e) {
    EXPECT_EQ(e.code(), ReferenceErrorCode::DivisionByZero);
    EXPECT_EQ(*e.pair_index(), 1u);
  }
}

TEST_F(BulkResolverTest, SymbolPairForm) {
  std::vector<std::pair<std::string, std::string>> pairs = {{"BTC", "USD"}, {"ETH", "BTC"}};
  auto out = resolver.ResolvePairs(pairs, TestPrices::NOW, store);
  EXPECT_EQ(out, resolver.Resolve({"BTC", "ETH"}, {"USD", "BTC"}, TestPrices::NOW, store));
}
