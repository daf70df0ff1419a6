// =============================================================================
// cdp_state_test.cpp
// =============================================================================
// Unit tests for the CDP lifecycle state machine.
//
// Validates:
//   - Every legal transition is accepted
//   - Every illegal transition is rejected (exhaustive)
//   - Closed is terminal
//   - stateTag / stateName agree with the variant alternative
// =============================================================================

#include "cdp/domain/cdp_state.hpp"
#include "cdp/domain/operation.hpp"

#include <gtest/gtest.h>

using cdp::domain::canTransition;
using cdp::domain::StateTag;

// -----------------------------------------------------------------------------
// 1. Legal transitions.
// -----------------------------------------------------------------------------
TEST(CdpStateTest, LegalTransitions) {
  EXPECT_TRUE(canTransition(StateTag::Active, StateTag::Active));
  EXPECT_TRUE(canTransition(StateTag::Active, StateTag::Liquidating));
  EXPECT_TRUE(canTransition(StateTag::Active, StateTag::Closed));
  EXPECT_TRUE(canTransition(StateTag::Liquidating, StateTag::Closed));
}

// -----------------------------------------------------------------------------
// 2. Everything else is illegal. Nothing leaves Closed, and a liquidating
//    position cannot be revived by the engine.
// -----------------------------------------------------------------------------
TEST(CdpStateTest, IllegalTransitions) {
  EXPECT_FALSE(canTransition(StateTag::Liquidating, StateTag::Active));
  EXPECT_FALSE(canTransition(StateTag::Liquidating, StateTag::Liquidating));
  EXPECT_FALSE(canTransition(StateTag::Closed, StateTag::Active));
  EXPECT_FALSE(canTransition(StateTag::Closed, StateTag::Liquidating));
  EXPECT_FALSE(canTransition(StateTag::Closed, StateTag::Closed));
}

TEST(CdpStateTest, TagsAndNames) {
  using namespace cdp::domain;
  EXPECT_EQ(stateTag(CdpState{Active{}}), StateTag::Active);
  EXPECT_EQ(stateTag(CdpState{Liquidating{1}}), StateTag::Liquidating);
  EXPECT_EQ(stateTag(CdpState{Closed{5}}), StateTag::Closed);

  EXPECT_STREQ(stateName(StateTag::Active), "active");
  EXPECT_STREQ(stateName(StateTag::Liquidating), "liquidating");
  EXPECT_STREQ(stateName(StateTag::Closed), "closed");

  // Default-constructed Active carries the unbounded health factor.
  EXPECT_EQ(Active{}.health_factor, cdp::fixed::kMaxSentinel);
}

TEST(CdpStateTest, OperationNamesRoundTrip) {
  using namespace cdp::domain;
  for (OperationKind kind :
       {OperationKind::Deposit, OperationKind::Withdraw, OperationKind::Mint,
        OperationKind::Burn, OperationKind::Close}) {
    EXPECT_EQ(parseOperationKind(operationName(kind)).value(), kind);
  }
  EXPECT_FALSE(parseOperationKind("liquidate").has_value());
}
