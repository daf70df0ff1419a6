// =============================================================================
// cdp_error_test.cpp
// =============================================================================
// Unit tests for the error taxonomy helpers and Result<T>.
//
// Validates:
//   - errorCode() tags are stable snake_case strings
//   - describe() carries the payload values
//   - isRetryable() classification
//   - Result<T> / Result<void> hold exactly one side
// =============================================================================

#include "cdp/domain/cdp_error.hpp"
#include "cdp/domain/result.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace cdp;

TEST(CdpErrorTest, CodesAreStable) {
  EXPECT_EQ(errorCode(errors::EmergencyShutdown{}), "emergency_shutdown");
  EXPECT_EQ(errorCode(errors::BelowMinCollateralRatio{15299, 15300}),
            "below_min_collateral_ratio");
  EXPECT_EQ(errorCode(errors::DebtFloorViolated{}), "debt_floor_violated");
  EXPECT_EQ(errorCode(errors::OutstandingDebt{}), "outstanding_debt");
}

TEST(CdpErrorTest, DescribeIncludesValues) {
  const std::string text =
      describe(errors::BelowMinCollateralRatio{15299, 15300});
  EXPECT_NE(text.find("15299"), std::string::npos);
  EXPECT_NE(text.find("15300"), std::string::npos);

  const std::string auth = describe(errors::Unauthorized{"alice", "mallory"});
  EXPECT_NE(auth.find("alice"), std::string::npos);
  EXPECT_NE(auth.find("mallory"), std::string::npos);
}

TEST(CdpErrorTest, Retryability) {
  EXPECT_FALSE(isRetryable(errors::EmergencyShutdown{}));
  EXPECT_FALSE(isRetryable(errors::Unauthorized{"a", "b"}));
  EXPECT_FALSE(isRetryable(errors::InvalidOperationForState{}));

  EXPECT_TRUE(isRetryable(errors::BelowMinCollateralRatio{}));
  EXPECT_TRUE(isRetryable(errors::WithdrawalLimitExceeded{}));
  EXPECT_TRUE(isRetryable(errors::DebtCeilingExceeded{}));
  EXPECT_TRUE(isRetryable(errors::InvalidAmount{}));
}

TEST(CdpErrorTest, ResultHoldsOneSide) {
  Result<int> ok = 42;
  ASSERT_TRUE(ok.ok());
  EXPECT_EQ(ok.value(), 42);
  EXPECT_THROW(ok.error(), std::bad_variant_access);

  Result<int> failed = CdpError{errors::InvalidAmount{0}};
  ASSERT_FALSE(failed);
  EXPECT_TRUE(std::holds_alternative<errors::InvalidAmount>(failed.error()));
  EXPECT_THROW(failed.value(), std::bad_variant_access);

  Result<void> done = Result<void>::success();
  EXPECT_TRUE(done.ok());
  Result<void> rejected = CdpError{errors::EmergencyShutdown{}};
  EXPECT_FALSE(rejected.ok());
}
