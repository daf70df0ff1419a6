#include "cdp/domain/cdp_state.hpp"

namespace cdp {
namespace domain {

StateTag stateTag(const CdpState& state) {
  struct TagVisitor {
    StateTag operator()(const Active&) const { return StateTag::Active; }
    StateTag operator()(const Liquidating&) const {
      return StateTag::Liquidating;
    }
    StateTag operator()(const Closed&) const { return StateTag::Closed; }
  };
  return std::visit(TagVisitor{}, state);
}

const char* stateName(StateTag tag) {
  switch (tag) {
    case StateTag::Active:
      return "active";
    case StateTag::Liquidating:
      return "liquidating";
    case StateTag::Closed:
      return "closed";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// canTransition: lifecycle graph
// -----------------------------------------------------------------------------
bool canTransition(StateTag current, StateTag next) {
  using S = StateTag;

  switch (current) {
    case S::Active:
      return next == S::Active ||
             next == S::Liquidating ||
             next == S::Closed;

    case S::Liquidating:
      return next == S::Closed;

    case S::Closed:
      return false;
  }

  return false;
}

}  // namespace domain
}  // namespace cdp
