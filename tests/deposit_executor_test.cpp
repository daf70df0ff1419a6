// =============================================================================
// deposit_executor_test.cpp
// =============================================================================
// Unit tests for executeDeposit.
//
// Validates:
//   - Collateral grows, debt untouched, health factor improves
//   - The input snapshot is never mutated
//   - Version / updated_at bookkeeping and stability fee accrual
//   - Fee accumulation overflow is reported, not wrapped
//   - Timestamps anywhere in the int64 range are accepted
// =============================================================================

#include "cdp/ops/deposit_executor.hpp"
#include "cdp/risk/health_calculator.hpp"

#include "cdp_test_helpers.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace cdp;
using namespace cdp_test;

class DepositExecutorTest : public ::testing::Test {
 protected:
  domain::Cdp reference = makeCdp(whole(2), whole(2000));
  domain::OperationContext context = makeContext(whole(2000));
};

TEST_F(DepositExecutorTest, AddsCollateral) {
  auto result = executeDeposit(makeParams(reference, whole(1), kOwner, 60),
                               context);
  ASSERT_TRUE(result);
  const DepositOutcome& outcome = result.value();

  EXPECT_EQ(outcome.deposited_amount, whole(1));
  EXPECT_EQ(outcome.updated_cdp.collateral_amount, whole(3));
  EXPECT_EQ(outcome.updated_cdp.debt_amount, whole(2000));
  EXPECT_GT(outcome.new_health_factor, outcome.previous_health_factor);
  EXPECT_EQ(outcome.previous_health_factor, healthFactor(reference, whole(2000)));

  ASSERT_TRUE(std::holds_alternative<domain::Active>(outcome.updated_cdp.state));
  EXPECT_EQ(std::get<domain::Active>(outcome.updated_cdp.state).health_factor,
            outcome.new_health_factor);
}

// -----------------------------------------------------------------------------
// The engine returns a new value; the caller's snapshot stays as it was.
// -----------------------------------------------------------------------------
TEST_F(DepositExecutorTest, InputSnapshotUnchanged) {
  const domain::OperationParams params = makeParams(reference, whole(1));
  auto result = executeDeposit(params, context);
  ASSERT_TRUE(result);
  EXPECT_EQ(params.cdp.collateral_amount, whole(2));
  EXPECT_EQ(params.cdp.version, 0u);
}

TEST_F(DepositExecutorTest, BumpsVersionAndTimestamp) {
  reference.updated_at = 100;
  reference.version = 7;

  auto later = executeDeposit(makeParams(reference, 1, kOwner, 160), context);
  ASSERT_TRUE(later);
  EXPECT_EQ(later.value().updated_cdp.version, 8u);
  EXPECT_EQ(later.value().updated_cdp.updated_at, 160);

  // An out-of-order timestamp never moves updated_at backwards.
  auto earlier = executeDeposit(makeParams(reference, 1, kOwner, 50), context);
  ASSERT_TRUE(earlier);
  EXPECT_EQ(earlier.value().updated_cdp.updated_at, 100);
}

// -----------------------------------------------------------------------------
// 5% a year on 2000 debt accrues 100 over one year, kept apart from the
// principal.
// -----------------------------------------------------------------------------
TEST_F(DepositExecutorTest, AccruesStabilityFee) {
  domain::CdpConfig config = defaultConfig();
  config.stability_fee_bps = 500;
  const domain::Cdp cdp = makeCdp(whole(2), whole(2000), config);

  auto result = executeDeposit(
      makeParams(cdp, whole(1), kOwner, fixed::kSecondsPerYear), context);
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value().updated_cdp.accrued_fees, whole(100));
  EXPECT_EQ(result.value().updated_cdp.debt_amount, whole(2000));
}

TEST_F(DepositExecutorTest, FeeOverflowReported) {
  domain::CdpConfig config = defaultConfig();
  config.stability_fee_bps = 500;
  domain::Cdp cdp = makeCdp(whole(2), whole(2000), config);
  cdp.accrued_fees = fixed::kMaxSentinel;

  auto result =
      executeDeposit(makeParams(cdp, whole(1), kOwner, 3600), context);
  ASSERT_FALSE(result);
  ASSERT_TRUE(holds<errors::ArithmeticOverflow>(result.error()));
  EXPECT_EQ(std::get<errors::ArithmeticOverflow>(result.error()).operation,
            domain::OperationKind::Deposit);
}

TEST_F(DepositExecutorTest, RejectsStranger) {
  auto result =
      executeDeposit(makeParams(reference, whole(1), kStranger), context);
  ASSERT_FALSE(result);
  EXPECT_TRUE(holds<errors::Unauthorized>(result.error()));
}

// -----------------------------------------------------------------------------
// Timestamps at opposite ends of the int64 range: the elapsed period is
// clamped instead of overflowing, and the fee is the one for that period.
// -----------------------------------------------------------------------------
TEST_F(DepositExecutorTest, ExtremeTimestampsAccrueClampedFee) {
  domain::CdpConfig config = defaultConfig();
  config.stability_fee_bps = 500;
  domain::Cdp cdp = makeCdp(whole(2), whole(2000), config);
  cdp.updated_at = std::numeric_limits<Timestamp>::min();

  const Timestamp now = std::numeric_limits<Timestamp>::max();
  auto result = executeDeposit(makeParams(cdp, whole(1), kOwner, now), context);
  ASSERT_TRUE(result);
  EXPECT_EQ(result.value().updated_cdp.updated_at, now);
  EXPECT_EQ(result.value().updated_cdp.accrued_fees,
            accruedStabilityFee(whole(2000), 500, now));

  // Going backwards across the whole range accrues nothing.
  cdp.updated_at = now;
  auto backwards = executeDeposit(
      makeParams(cdp, whole(1), kOwner, std::numeric_limits<Timestamp>::min()),
      context);
  ASSERT_TRUE(backwards);
  EXPECT_EQ(backwards.value().updated_cdp.accrued_fees, 0u);
  EXPECT_EQ(backwards.value().updated_cdp.updated_at, now);
}
