// =============================================================================
// validator_test.cpp
// =============================================================================
// Unit tests for the operation validators.
//
// Validates:
//   - Shared check order: shutdown → authorization → amount → state
//   - Withdraw: availability, per-call limit, buffered ratio (in that order)
//   - Mint: ceiling, floor, buffered ratio
//   - Burn: over-repayment (principal plus fees) and dust below the floor
//   - Close: unpaid principal or fees
//   - Close: outstanding debt and the per-call limit
//   - The reference scenario (0.5 rejected, 0.1 accepted)
// =============================================================================

#include "cdp/validation/validator.hpp"

#include "cdp_test_helpers.hpp"

#include <gtest/gtest.h>

using namespace cdp;
using namespace cdp_test;
using domain::OperationKind;

class ValidatorTest : public ::testing::Test {
 protected:
  domain::Cdp reference = makeCdp(whole(2), whole(2000));
  domain::OperationContext context = makeContext(whole(2000), 300);
};

// -----------------------------------------------------------------------------
// 1. Emergency shutdown is checked before anything else, even authorization.
// -----------------------------------------------------------------------------
TEST_F(ValidatorTest, ShutdownRejectsFirst) {
  context.emergency_shutdown = true;
  auto result =
      validate(OperationKind::Deposit, makeParams(reference, 0, kStranger),
               context);
  ASSERT_FALSE(result);
  EXPECT_TRUE(holds<errors::EmergencyShutdown>(result.error()));
}

// -----------------------------------------------------------------------------
// 2. Authorization is checked before the amount.
// -----------------------------------------------------------------------------
TEST_F(ValidatorTest, UnauthorizedBeforeAmount) {
  auto result = validate(OperationKind::Mint,
                         makeParams(reference, 0, kStranger), context);
  ASSERT_FALSE(result);
  ASSERT_TRUE(holds<errors::Unauthorized>(result.error()));
  const auto& e = std::get<errors::Unauthorized>(result.error());
  EXPECT_EQ(e.owner, kOwner);
  EXPECT_EQ(e.caller, kStranger);
}

TEST_F(ValidatorTest, ZeroAmountRejectedExceptForClose) {
  for (OperationKind kind : {OperationKind::Deposit, OperationKind::Withdraw,
                             OperationKind::Mint, OperationKind::Burn}) {
    auto result = validate(kind, makeParams(reference, 0), context);
    ASSERT_FALSE(result);
    EXPECT_TRUE(holds<errors::InvalidAmount>(result.error()));
  }

  // Close ignores the amount; here it fails on the debt instead.
  auto close = validate(OperationKind::Close, makeParams(reference, 0), context);
  ASSERT_FALSE(close);
  EXPECT_TRUE(holds<errors::OutstandingDebt>(close.error()));
}

// -----------------------------------------------------------------------------
// 3. Only Active accepts operations.
// -----------------------------------------------------------------------------
TEST_F(ValidatorTest, NonActiveStatesRejected) {
  domain::Cdp liquidating = reference;
  liquidating.state = domain::Liquidating{whole(1300)};
  domain::Cdp closed = makeCdp(0, 0);
  closed.state = domain::Closed{10};

  auto r1 = validate(OperationKind::Deposit, makeParams(liquidating, whole(1)),
                     context);
  ASSERT_FALSE(r1);
  ASSERT_TRUE(holds<errors::InvalidOperationForState>(r1.error()));
  EXPECT_EQ(std::get<errors::InvalidOperationForState>(r1.error()).state,
            domain::StateTag::Liquidating);

  auto r2 = validate(OperationKind::Close, makeParams(closed, 0), context);
  ASSERT_FALSE(r2);
  ASSERT_TRUE(holds<errors::InvalidOperationForState>(r2.error()));
  EXPECT_EQ(std::get<errors::InvalidOperationForState>(r2.error()).operation,
            OperationKind::Close);
}

// -----------------------------------------------------------------------------
// 4. Reference scenario: 0.5 leaves 150% < 153%, 0.1 leaves 190%.
// -----------------------------------------------------------------------------
TEST_F(ValidatorTest, WithdrawReferenceScenario) {
  auto rejected = validateWithdraw(makeParams(reference, milli(500)), context);
  ASSERT_FALSE(rejected);
  ASSERT_TRUE(holds<errors::BelowMinCollateralRatio>(rejected.error()));
  const auto& e = std::get<errors::BelowMinCollateralRatio>(rejected.error());
  EXPECT_EQ(e.current, 15000u);
  EXPECT_EQ(e.minimum, 15300u);

  EXPECT_TRUE(validateWithdraw(makeParams(reference, milli(100)), context));
}

TEST_F(ValidatorTest, WithdrawAvailabilityBeforeLimit) {
  context.max_withdraw_amount = whole(1);

  auto over_balance = validateWithdraw(makeParams(reference, whole(3)), context);
  ASSERT_FALSE(over_balance);
  EXPECT_TRUE(
      holds<errors::InsufficientAvailableCollateral>(over_balance.error()));

  // Debt-free so the ratio cannot be the reason.
  auto over_limit =
      validateWithdraw(makeParams(makeCdp(whole(2), 0), milli(1500)), context);
  ASSERT_FALSE(over_limit);
  ASSERT_TRUE(holds<errors::WithdrawalLimitExceeded>(over_limit.error()));
  EXPECT_EQ(std::get<errors::WithdrawalLimitExceeded>(over_limit.error()).limit,
            whole(1));
}

// -----------------------------------------------------------------------------
// 5. Mint: ceiling, then floor, then ratio.
// -----------------------------------------------------------------------------
TEST_F(ValidatorTest, MintCeiling) {
  domain::CdpConfig config = defaultConfig();
  config.debt_ceiling = whole(2100);
  const domain::Cdp capped = makeCdp(whole(10), whole(2000), config);

  auto result = validateMint(makeParams(capped, whole(101)), context);
  ASSERT_FALSE(result);
  ASSERT_TRUE(holds<errors::DebtCeilingExceeded>(result.error()));
  EXPECT_EQ(std::get<errors::DebtCeilingExceeded>(result.error()).requested,
            whole(2101));

  EXPECT_TRUE(validateMint(makeParams(capped, whole(100)), context));
}

TEST_F(ValidatorTest, MintOverflowCountsAsCeiling) {
  const domain::Cdp huge = makeCdp(whole(10), fixed::kMaxSentinel - 1);
  auto result = validateMint(makeParams(huge, 2), context);
  ASSERT_FALSE(result);
  EXPECT_TRUE(holds<errors::DebtCeilingExceeded>(result.error()));
}

TEST_F(ValidatorTest, MintFloorFromZeroDebt) {
  domain::CdpConfig config = defaultConfig();
  config.debt_floor = whole(100);
  const domain::Cdp fresh = makeCdp(whole(10), 0, config);

  auto dust = validateMint(makeParams(fresh, whole(50)), context);
  ASSERT_FALSE(dust);
  ASSERT_TRUE(holds<errors::DebtFloorViolated>(dust.error()));
  EXPECT_EQ(std::get<errors::DebtFloorViolated>(dust.error()).remainder,
            whole(50));

  EXPECT_TRUE(validateMint(makeParams(fresh, whole(100)), context));
}

TEST_F(ValidatorTest, MintRatio) {
  // Reference position can take at most ~614.379 more at 153%.
  auto result = validateMint(makeParams(reference, whole(615)), context);
  ASSERT_FALSE(result);
  EXPECT_TRUE(holds<errors::BelowMinCollateralRatio>(result.error()));

  EXPECT_TRUE(validateMint(makeParams(reference, whole(614)), context));
}

// -----------------------------------------------------------------------------
// 6. Burn.
// -----------------------------------------------------------------------------
TEST_F(ValidatorTest, BurnCannotOverpay) {
  auto result = validateBurn(makeParams(reference, whole(2001)), context);
  ASSERT_FALSE(result);
  EXPECT_TRUE(holds<errors::InvalidAmount>(result.error()));
}

TEST_F(ValidatorTest, BurnCannotLeaveDust) {
  domain::CdpConfig config = defaultConfig();
  config.debt_floor = whole(100);
  const domain::Cdp cdp = makeCdp(whole(2), whole(150), config);

  auto dust = validateBurn(makeParams(cdp, whole(100)), context);
  ASSERT_FALSE(dust);
  ASSERT_TRUE(holds<errors::DebtFloorViolated>(dust.error()));
  EXPECT_EQ(std::get<errors::DebtFloorViolated>(dust.error()).remainder,
            whole(50));

  // Full repayment and a remainder at the floor are both fine.
  EXPECT_TRUE(validateBurn(makeParams(cdp, whole(150)), context));
  EXPECT_TRUE(validateBurn(makeParams(cdp, whole(50)), context));
}

// -----------------------------------------------------------------------------
// Fees are paid first: the overpay bound is debt plus fees, and the floor
// applies to the principal that is left.
// -----------------------------------------------------------------------------
TEST_F(ValidatorTest, BurnCoversFeesBeforePrincipal) {
  domain::CdpConfig config = defaultConfig();
  config.debt_floor = whole(100);
  config.stability_fee_bps = 500;
  domain::Cdp cdp = makeCdp(whole(2), whole(1000), config);
  cdp.accrued_fees = whole(10);

  // 10 already accrued plus 50 over the year: 1060 owed in total.
  const Timestamp year = fixed::kSecondsPerYear;
  EXPECT_TRUE(validateBurn(makeParams(cdp, whole(1060), kOwner, year), context));

  auto over = validateBurn(makeParams(cdp, whole(1061), kOwner, year), context);
  ASSERT_FALSE(over);
  EXPECT_TRUE(holds<errors::InvalidAmount>(over.error()));

  // 960 pays 60 of fees and 900 of principal, leaving 100: at the floor.
  EXPECT_TRUE(validateBurn(makeParams(cdp, whole(960), kOwner, year), context));
  auto dust = validateBurn(makeParams(cdp, whole(961), kOwner, year), context);
  ASSERT_FALSE(dust);
  ASSERT_TRUE(holds<errors::DebtFloorViolated>(dust.error()));
  EXPECT_EQ(std::get<errors::DebtFloorViolated>(dust.error()).remainder,
            whole(99));

  cdp.accrued_fees = fixed::kMaxSentinel;
  auto overflow =
      validateBurn(makeParams(cdp, whole(1), kOwner, year), context);
  ASSERT_FALSE(overflow);
  EXPECT_TRUE(holds<errors::ArithmeticOverflow>(overflow.error()));
}

TEST_F(ValidatorTest, CloseRequiresFeesSettled) {
  domain::CdpConfig config = defaultConfig();
  domain::Cdp cdp = makeCdp(whole(2), 0, config);
  EXPECT_TRUE(validateClose(makeParams(cdp, 0), context));

  cdp.accrued_fees = 1;
  auto result = validateClose(makeParams(cdp, 0), context);
  ASSERT_FALSE(result);
  ASSERT_TRUE(holds<errors::OutstandingDebt>(result.error()));
  EXPECT_EQ(std::get<errors::OutstandingDebt>(result.error()).fees, 1u);
}

// -----------------------------------------------------------------------------
// 7. Deposit overflow.
// -----------------------------------------------------------------------------
TEST_F(ValidatorTest, DepositOverflow) {
  const domain::Cdp full = makeCdp(fixed::kMaxSentinel, 0);
  auto result = validateDeposit(makeParams(full, 1), context);
  ASSERT_FALSE(result);
  EXPECT_TRUE(holds<errors::ArithmeticOverflow>(result.error()));
}

// -----------------------------------------------------------------------------
// 8. Close.
// -----------------------------------------------------------------------------
TEST_F(ValidatorTest, CloseRequiresLimit) {
  const domain::Cdp debt_free = makeCdp(whole(2), 0);
  EXPECT_TRUE(validateClose(makeParams(debt_free, 0), context));

  context.max_withdraw_amount = whole(1);
  auto result = validateClose(makeParams(debt_free, 0), context);
  ASSERT_FALSE(result);
  EXPECT_TRUE(holds<errors::WithdrawalLimitExceeded>(result.error()));
}
