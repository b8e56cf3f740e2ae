#include <gtest/gtest.h>
#include "oracle/ref_data_store.hpp"
#include "oracle/pair_resolver.hpp"
#include "common/reference_error.hpp"

#include <string>
#include <vector>

using FixedPoint::Uint128;

namespace {
  Uint128 Usd(unsigned long long whole) { return static_cast<Uint128>(whole) * FixedPoint::SCALE; }
}

class RefDataStoreTest : public ::testing::Test {
protected:
  RefDataStore store;
};

TEST_F(RefDataStoreTest, EmptyStoreHasNoRecords) {
  EXPECT_EQ(store.Size(), 0u);
  EXPECT_FALSE(store.Get("BTC").has_value());
  EXPECT_FALSE(store.GetRef("BTC").has_value());
}

TEST_F(RefDataStoreTest, RelayWritesRecords) {
  EXPECT_EQ(store.Relay({"AAA", "BBB", "CCC"}, {Usd(1000), Usd(2000), Usd(3000)}, 100, 1), 3u);
  auto ref = store.GetRef("BBB");
  ASSERT_TRUE(ref.has_value());
  EXPECT_EQ(*ref, (RefData{Usd(2000), 100, 1}));
  auto raw = store.Get("CCC");
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(raw->price, Usd(3000));
  EXPECT_EQ(raw->last_updated, 100u);
  EXPECT_EQ(store.Symbols(), (std::vector<std::string>{"AAA", "BBB", "CCC"}));
}

TEST_F(RefDataStoreTest, RelaySkipsSymbolsThatAreNotNewer) {
  store.Relay({"AAA", "BBB"}, {Usd(1), Usd(2)}, 100, 1);
  // same resolve time: nothing changes
  EXPECT_EQ(store.Relay({"AAA", "BBB"}, {Usd(10), Usd(20)}, 100, 2), 0u);
  EXPECT_EQ(store.GetRef("AAA")->rate, Usd(1));
  // older for AAA, new symbol CCC
  store.Relay({"AAA"}, {Usd(5)}, 200, 3);
  EXPECT_EQ(store.Relay({"AAA", "CCC"}, {Usd(7), Usd(8)}, 150, 4), 1u);
  EXPECT_EQ(*store.GetRef("AAA"), (RefData{Usd(5), 200, 3}));
  EXPECT_EQ(*store.GetRef("CCC"), (RefData{Usd(8), 150, 4}));
}

TEST_F(RefDataStoreTest, RelayRejectsMismatchedSizesWithoutWriting) {
  try {
    store.Relay({"AAA", "BBB"}, {Usd(1)}, 100, 1);
    FAIL() << "expected ReferenceError";
  } catch (const ReferenceError& e) {
    EXPECT_EQ(e.code(), ReferenceErrorCode::LengthMismatch);
    EXPECT_STREQ(e.what(), "MISMATCHED_INPUT_SIZES");
  }
  EXPECT_EQ(store.Size(), 0u);
}

TEST_F(RefDataStoreTest, ForceRelayOverwritesRegardlessOfTime) {
  store.Relay({"AAA"}, {Usd(5)}, 200, 1);
  store.ForceRelay({"AAA"}, {Usd(3)}, 50, 2);
  EXPECT_EQ(*store.GetRef("AAA"), (RefData{Usd(3), 50, 2}));
  try {
    store.ForceRelay({"AAA"}, {}, 300, 3);
    FAIL() << "expected ReferenceError";
  } catch (const ReferenceError& e) {
    EXPECT_STREQ(e.what(), "NOT_ALL_INPUT_SIZES_ARE_THE_SAME");
  }
}

TEST_F(RefDataStoreTest, RelayedRatesResolveAgainstUsd) {
  store.Relay({"AAA", "BBB", "CCC"}, {Usd(1000), Usd(2000), Usd(3000)}, 100, 1);
  PairResolver resolver;
  EXPECT_EQ(resolver.Resolve("BBB", "USD", 500, store),
            (ReferenceData{Usd(2000), 100, 500}));
  EXPECT_EQ(resolver.Resolve("AAA", "BBB", 500, store).rate, FixedPoint::SCALE / 2);
}
