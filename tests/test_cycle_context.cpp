#include <gtest/gtest.h>
#include "core/cycle_context.hpp"
#include "test_fakes.hpp"
#include <iterator>

using namespace fundarb;
using namespace fundarb::testing;

class CycleContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        balances_ = std::make_shared<FakeBalanceProvider>();
        balances_->set(Exchange::ASTER, 5000.0).set(Exchange::HYPERLIQUID, 7000.0);
    }

    std::shared_ptr<FakeBalanceProvider> balances_;
    CycleContext context_{nullptr, std::chrono::minutes(30)};
};

TEST_F(CycleContextTest, Balances_FetchedOncePerCycle) {
    context_.begin_cycle();

    const auto& first = context_.balances(balances_, std::chrono::milliseconds(500));
    ASSERT_EQ(first.size(), 2u);
    EXPECT_DOUBLE_EQ(first.at(Exchange::ASTER), 5000.0);

    int calls = balances_->calls();
    EXPECT_EQ(calls, static_cast<int>(std::size(ALL_EXCHANGES)));

    context_.balances(balances_, std::chrono::milliseconds(500));
    EXPECT_EQ(balances_->calls(), calls);

    context_.begin_cycle();
    EXPECT_FALSE(context_.balances_loaded());
    context_.balances(balances_, std::chrono::milliseconds(500));
    EXPECT_EQ(balances_->calls(), calls * 2);
    EXPECT_EQ(context_.cycle_count(), 2u);
}

TEST_F(CycleContextTest, Balances_EmptyWithoutProvider) {
    context_.begin_cycle();
    EXPECT_TRUE(context_.balances(nullptr, std::chrono::milliseconds(100)).empty());
    EXPECT_TRUE(context_.balances_loaded());
}

TEST_F(CycleContextTest, Cooldown_KeyIgnoresLegOrder) {
    EXPECT_EQ(CooldownStore::cooldown_key("ETH", Exchange::LIGHTER, Exchange::ASTER),
              CooldownStore::cooldown_key("ETH", Exchange::ASTER, Exchange::LIGHTER));
    EXPECT_EQ(CooldownStore::cooldown_key("ETH", Exchange::LIGHTER, Exchange::ASTER), "ETH-ASTER-LIGHTER");
}

TEST_F(CycleContextTest, Cooldown_ExpiresAfterTtl) {
    auto& cooldowns = context_.cooldowns();
    auto marked_at = wall_now();
    cooldowns.mark("ETH-ASTER-LIGHTER", marked_at);

    EXPECT_TRUE(cooldowns.is_filtered("ETH-ASTER-LIGHTER", marked_at + std::chrono::minutes(10)));
    EXPECT_EQ(cooldowns.remaining_minutes("ETH-ASTER-LIGHTER", marked_at + std::chrono::minutes(10)).value_or(-1), 20);
    EXPECT_FALSE(cooldowns.is_filtered("ETH-ASTER-LIGHTER", marked_at + std::chrono::minutes(30)));
    EXPECT_FALSE(cooldowns.is_filtered("SOL-ASTER-LIGHTER", marked_at));

    EXPECT_EQ(cooldowns.purge_expired(marked_at + std::chrono::minutes(31)), 1u);
    EXPECT_EQ(cooldowns.size(), 0u);
}

TEST_F(CycleContextTest, OpenTimes_DefaultToInMemoryStore) {
    auto opened = wall_now();
    context_.open_times().record_open("ETH-ASTER-LIGHTER", opened);

    EXPECT_EQ(context_.open_times().size(), 1u);
    EXPECT_NEAR(context_.open_times().age_hours("ETH-ASTER-LIGHTER", opened + std::chrono::minutes(90)).value_or(-1.0),
                1.5, 1e-9);
    EXPECT_TRUE(context_.open_times().remove_open("ETH-ASTER-LIGHTER"));
    EXPECT_FALSE(context_.open_times().age_hours("ETH-ASTER-LIGHTER", opened).has_value());
}

TEST_F(CycleContextTest, OpenTimes_RetainDropsVanishedPairs) {
    auto opened = wall_now();
    auto& store = context_.open_times();
    store.record_open("ETH-ASTER-HYPERLIQUID", opened);
    store.record_open("BTC-LIGHTER-EXTENDED", opened);

    EXPECT_EQ(store.retain_open({"ETH-ASTER-HYPERLIQUID"}), 1u);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.age_hours("ETH-ASTER-HYPERLIQUID", opened).has_value());
    EXPECT_FALSE(store.age_hours("BTC-LIGHTER-EXTENDED", opened).has_value());
}
