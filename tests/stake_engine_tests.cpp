#include <gtest/gtest.h>
#include <evonft/stake_ledger.hpp>
#include <evonft/accrual.hpp>

#include <vector>

using namespace evonft;

namespace {

constexpr uint64_t ALICE    = 1001;
constexpr uint64_t BOB      = 1002;
constexpr uint32_t T0       = 1700000000;

stake_config make_config(uint32_t min_staking, uint32_t on_mint = 0, uint32_t on_transfer = 0) {
    stake_config c;
    c.min_staking_seconds       = min_staking;
    c.auto_stake_on_mint        = on_mint;
    c.auto_stake_on_transfer    = on_transfer;
    return c;
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class StakeEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = stake_engine(make_config(100));
        token_  = engine_.mint_token(1, ALICE, T0);
    }

    stake_engine    engine_{stake_config{}};
    token_state     token_;
    stake_record    record_;
};

TEST_F(StakeEngineTest, MintWithoutAutoStakeIsNotStaked) {
    EXPECT_EQ(token_.owner, ALICE);
    EXPECT_EQ(token_.minted_at, T0);
    EXPECT_EQ(token_.held_since, T0);
    EXPECT_FALSE(token_.auto_stake_on_mint);
    EXPECT_FALSE(engine_.is_staked(record_, token_, T0));
}

TEST_F(StakeEngineTest, StakeMarksTokenStaked) {
    ASSERT_EQ(engine_.stake(record_, token_, ALICE, T0), err::NONE);

    EXPECT_TRUE(record_.is_staked);
    EXPECT_EQ(record_.first_staked_at, T0);
    EXPECT_EQ(record_.last_staked_at, T0);
    EXPECT_EQ(record_.accumulated, 0u);
    EXPECT_TRUE(engine_.is_staked(record_, token_, T0));
}

TEST_F(StakeEngineTest, StakeTwiceFailsWithAlreadyStaked) {
    ASSERT_EQ(engine_.stake(record_, token_, ALICE, T0), err::NONE);
    auto before = record_;

    EXPECT_EQ(engine_.stake(record_, token_, ALICE, T0 + 5), err::ALREADY_STAKED);
    EXPECT_EQ(record_.last_staked_at, before.last_staked_at);
    EXPECT_EQ(record_.first_staked_at, before.first_staked_at);
}

TEST_F(StakeEngineTest, NonOwnerCannotStakeOrUnstake) {
    EXPECT_EQ(engine_.stake(record_, token_, BOB, T0), err::NOT_OWNER);
    EXPECT_FALSE(record_.is_staked);

    ASSERT_EQ(engine_.stake(record_, token_, ALICE, T0), err::NONE);
    EXPECT_EQ(engine_.unstake(record_, token_, BOB, T0 + 500), err::NOT_OWNER);
    EXPECT_TRUE(record_.is_staked);
}

TEST_F(StakeEngineTest, UnstakeBeforeMinimumFails) {
    ASSERT_EQ(engine_.stake(record_, token_, ALICE, T0), err::NONE);

    EXPECT_FALSE(engine_.can_unstake(record_, T0 + 50));
    EXPECT_EQ(engine_.unstake(record_, token_, ALICE, T0 + 50), err::NOT_UNSTAKEABLE);
    EXPECT_TRUE(record_.is_staked);
    EXPECT_EQ(record_.accumulated, 0u);
}

TEST_F(StakeEngineTest, UnstakeExactlyAtMinimumSucceeds) {
    ASSERT_EQ(engine_.stake(record_, token_, ALICE, T0), err::NONE);

    EXPECT_TRUE(engine_.can_unstake(record_, T0 + 100));
    ASSERT_EQ(engine_.unstake(record_, token_, ALICE, T0 + 100), err::NONE);
    EXPECT_FALSE(record_.is_staked);
    EXPECT_FALSE(engine_.is_staked(record_, token_, T0 + 100));
    EXPECT_EQ(record_.accumulated, 100u);
}

TEST_F(StakeEngineTest, UnstakeWhenNotStakedFails) {
    EXPECT_EQ(engine_.unstake(record_, token_, ALICE, T0 + 1000), err::NOT_UNSTAKEABLE);
    EXPECT_EQ(record_.accumulated, 0u);
}

TEST(StakeEngine, MinimumStakingScenarioFromZero) {
    stake_engine engine(make_config(100));
    auto tok = engine.mint_token(7, ALICE, 0);
    stake_record rec;

    ASSERT_EQ(engine.stake(rec, tok, ALICE, 0), err::NONE);
    EXPECT_EQ(engine.unstake(rec, tok, ALICE, 50), err::NOT_UNSTAKEABLE);
    ASSERT_EQ(engine.unstake(rec, tok, ALICE, 100), err::NONE);
    EXPECT_EQ(rec.accumulated, 100u);
}

TEST(StakeEngine, AccumulatedIsSumOfClosedPeriods) {
    stake_engine engine(make_config(10));
    auto tok = engine.mint_token(1, ALICE, T0);
    stake_record rec;

    const std::vector<std::pair<uint32_t, uint32_t>> periods = {
        {T0 + 10,  T0 + 40},
        {T0 + 100, T0 + 110},
        {T0 + 500, T0 + 1500},
    };

    uint32_t expected = 0;
    uint32_t previous = 0;
    for (auto& p : periods) {
        ASSERT_EQ(engine.stake(rec, tok, ALICE, p.first), err::NONE);
        EXPECT_EQ(rec.accumulated, previous);
        ASSERT_EQ(engine.unstake(rec, tok, ALICE, p.second), err::NONE);

        expected += p.second - p.first;
        EXPECT_GE(rec.accumulated, previous);
        EXPECT_EQ(rec.accumulated, expected);
        previous = rec.accumulated;
    }
    EXPECT_EQ(rec.first_staked_at, T0 + 10);
    EXPECT_EQ(rec.last_staked_at, T0 + 500);
}

TEST(StakeEngine, ZeroMinimumAllowsImmediateUnstake) {
    stake_engine engine(make_config(0));
    auto tok = engine.mint_token(1, ALICE, T0);
    stake_record rec;

    ASSERT_EQ(engine.stake(rec, tok, ALICE, T0), err::NONE);
    ASSERT_EQ(engine.unstake(rec, tok, ALICE, T0), err::NONE);
    EXPECT_EQ(rec.accumulated, 0u);
    EXPECT_FALSE(rec.is_staked);
}

TEST(StakeEngine, AccumulatedSaturatesAtClockLimit) {
    stake_engine engine(make_config(0));
    auto tok = engine.mint_token(1, ALICE, T0);
    stake_record rec;
    rec.has_staked      = true;
    rec.first_staked_at = T0;
    rec.accumulated     = UINT32_MAX - 10;

    ASSERT_EQ(engine.stake(rec, tok, ALICE, T0), err::NONE);
    ASSERT_EQ(engine.unstake(rec, tok, ALICE, T0 + 100), err::NONE);
    EXPECT_EQ(rec.accumulated, UINT32_MAX);
    EXPECT_EQ(stake_duration(rec, accrual_policy::CUMULATIVE, T0 + 200), UINT32_MAX);
}

// ============================================================================
// Automatic staking
// ============================================================================

TEST(AutoStake, MintWindowStakesUntilExpiry) {
    stake_engine engine(make_config(0, 3600));
    auto tok = engine.mint_token(1, ALICE, T0);
    stake_record rec;

    EXPECT_TRUE(tok.auto_stake_on_mint);
    EXPECT_TRUE(engine.is_staked(rec, tok, T0));
    EXPECT_TRUE(engine.is_staked(rec, tok, T0 + 3599));
    EXPECT_FALSE(engine.is_staked(rec, tok, T0 + 3600));
    EXPECT_FALSE(engine.is_staked(rec, tok, T0 + 100000));
}

TEST(AutoStake, ManualStakeRejectedInsideMintWindow) {
    stake_engine engine(make_config(0, 3600));
    auto tok = engine.mint_token(1, ALICE, T0);
    stake_record rec;

    EXPECT_EQ(engine.stake(rec, tok, ALICE, T0 + 10), err::ALREADY_STAKED);
    EXPECT_EQ(rec.first_staked_at, 0u);
    EXPECT_EQ(engine.stake(rec, tok, ALICE, T0 + 3600), err::NONE);
}

TEST(AutoStake, AutoStakedTokenCannotBeUnstaked) {
    stake_engine engine(make_config(0, 3600));
    auto tok = engine.mint_token(1, ALICE, T0);
    stake_record rec;

    EXPECT_TRUE(engine.is_staked(rec, tok, T0 + 10));
    EXPECT_FALSE(engine.can_unstake(rec, T0 + 10));
    EXPECT_EQ(engine.unstake(rec, tok, ALICE, T0 + 10), err::NOT_UNSTAKEABLE);
    EXPECT_EQ(rec.accumulated, 0u);
}

TEST(AutoStake, MintFlagNotSetWhenDisabled) {
    stake_engine engine(make_config(0, 0, 600));
    auto tok = engine.mint_token(1, ALICE, T0);

    EXPECT_FALSE(tok.auto_stake_on_mint);
    EXPECT_FALSE(tok.auto_stake_on_transfer);
    EXPECT_FALSE(engine.in_auto_window(tok, T0));
}

TEST(AutoStake, TransferOpensTransferWindow) {
    stake_engine engine(make_config(0, 0, 600));
    auto tok = engine.mint_token(1, ALICE, T0);
    stake_record rec;

    ASSERT_EQ(engine.transfer(tok, rec, ALICE, BOB, T0 + 100), err::NONE);
    EXPECT_TRUE(tok.auto_stake_on_transfer);
    EXPECT_EQ(tok.held_since, T0 + 100);
    EXPECT_TRUE(engine.is_staked(rec, tok, T0 + 699));
    EXPECT_FALSE(engine.is_staked(rec, tok, T0 + 700));

    // the window blocks the next move until it expires
    EXPECT_EQ(engine.transfer(tok, rec, BOB, ALICE, T0 + 200), err::TOKEN_STAKED);
    EXPECT_EQ(tok.owner, BOB);
    EXPECT_EQ(engine.transfer(tok, rec, BOB, ALICE, T0 + 700), err::NONE);
    EXPECT_EQ(tok.owner, ALICE);
}

TEST(AutoStake, WindowNearClockLimitDoesNotWrap) {
    stake_engine engine(make_config(0, UINT32_MAX));
    auto tok = engine.mint_token(1, ALICE, UINT32_MAX - 10);
    stake_record rec;

    EXPECT_TRUE(engine.is_staked(rec, tok, UINT32_MAX));
}

// ============================================================================
// Transfer guard
// ============================================================================

TEST(TransferGuard, StakedTokenCannotMove) {
    stake_engine engine(make_config(100));
    auto tok = engine.mint_token(1, ALICE, T0);
    stake_record rec;

    ASSERT_EQ(engine.stake(rec, tok, ALICE, T0), err::NONE);
    EXPECT_EQ(engine.check_transferable(rec, tok, ALICE, T0 + 10), err::TOKEN_STAKED);
    EXPECT_EQ(engine.transfer(tok, rec, ALICE, BOB, T0 + 10), err::TOKEN_STAKED);
    EXPECT_EQ(tok.owner, ALICE);
    EXPECT_EQ(tok.held_since, T0);
}

TEST(TransferGuard, MintWindowBlocksTransfer) {
    stake_engine engine(make_config(0, 3600));
    auto tok = engine.mint_token(1, ALICE, T0);
    stake_record rec;

    EXPECT_EQ(engine.transfer(tok, rec, ALICE, BOB, T0 + 1), err::TOKEN_STAKED);
    EXPECT_EQ(engine.transfer(tok, rec, ALICE, BOB, T0 + 3600), err::NONE);
}

TEST(TransferGuard, OnlyOwnerCanTransfer) {
    stake_engine engine(make_config(0));
    auto tok = engine.mint_token(1, ALICE, T0);
    stake_record rec;

    EXPECT_EQ(engine.transfer(tok, rec, BOB, BOB, T0), err::NOT_OWNER);
    EXPECT_EQ(tok.owner, ALICE);
}

TEST(TransferGuard, TransferKeepsStakeHistory) {
    stake_engine engine(make_config(100));
    auto tok = engine.mint_token(1, ALICE, T0);
    stake_record rec;

    ASSERT_EQ(engine.stake(rec, tok, ALICE, T0), err::NONE);
    ASSERT_EQ(engine.unstake(rec, tok, ALICE, T0 + 250), err::NONE);
    auto before = rec;

    ASSERT_EQ(engine.transfer(tok, rec, ALICE, BOB, T0 + 300), err::NONE);
    EXPECT_EQ(tok.owner, BOB);
    EXPECT_FALSE(tok.auto_stake_on_transfer);
    EXPECT_EQ(rec.accumulated, before.accumulated);
    EXPECT_EQ(rec.first_staked_at, before.first_staked_at);

    // the new owner continues on top of the carried history
    ASSERT_EQ(engine.stake(rec, tok, BOB, T0 + 400), err::NONE);
    ASSERT_EQ(engine.unstake(rec, tok, BOB, T0 + 500), err::NONE);
    EXPECT_EQ(rec.accumulated, 350u);
    EXPECT_EQ(engine.stake(rec, tok, ALICE, T0 + 600), err::NOT_OWNER);
}

TEST(TransferGuard, RangeWithOneStakedTokenMovesNothing) {
    stake_engine engine(make_config(100));
    std::vector<token_state> toks = {
        engine.mint_token(1, ALICE, T0),
        engine.mint_token(2, ALICE, T0),
    };
    std::vector<stake_record> recs(2);
    ASSERT_EQ(engine.stake(recs[1], toks[1], ALICE, T0), err::NONE);

    EXPECT_EQ(engine.transfer_range(toks, recs, ALICE, BOB, T0 + 10), err::TOKEN_STAKED);
    for (auto& tok : toks) {
        EXPECT_EQ(tok.owner, ALICE) << "token " << tok.id;
        EXPECT_EQ(tok.held_since, T0) << "token " << tok.id;
    }
}

TEST(TransferGuard, RangeWithForeignTokenMovesNothing) {
    stake_engine engine(make_config(0, 0, 60));
    std::vector<token_state> toks = {
        engine.mint_token(1, ALICE, T0),
        engine.mint_token(2, BOB, T0),
    };
    std::vector<stake_record> recs(2);

    EXPECT_EQ(engine.transfer_range(toks, recs, ALICE, BOB, T0 + 10), err::NOT_OWNER);
    EXPECT_EQ(toks[0].owner, ALICE);
    EXPECT_FALSE(toks[0].auto_stake_on_transfer);
}

TEST(TransferGuard, RangeMovesEveryToken) {
    stake_engine engine(make_config(0, 0, 60));
    std::vector<token_state> toks = {
        engine.mint_token(1, ALICE, T0),
        engine.mint_token(2, ALICE, T0),
        engine.mint_token(3, ALICE, T0),
    };
    std::vector<stake_record> recs(3);

    ASSERT_EQ(engine.transfer_range(toks, recs, ALICE, BOB, T0 + 10), err::NONE);
    for (auto& tok : toks) {
        EXPECT_EQ(tok.owner, BOB);
        EXPECT_EQ(tok.held_since, T0 + 10);
        EXPECT_TRUE(engine.is_staked(recs[0], tok, T0 + 69));
    }
}

TEST(TransferGuard, RangeRejectsMismatchedInput) {
    stake_engine engine(make_config(0));
    std::vector<token_state> toks = { engine.mint_token(1, ALICE, T0) };
    std::vector<stake_record> none;
    std::vector<token_state> empty;

    EXPECT_EQ(engine.transfer_range(toks, none, ALICE, BOB, T0), err::PARAM_ERROR);
    EXPECT_EQ(engine.transfer_range(empty, none, ALICE, BOB, T0), err::PARAM_ERROR);
    EXPECT_EQ(toks[0].owner, ALICE);
}
