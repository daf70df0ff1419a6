#include "cdp/domain/operation.hpp"

namespace cdp {
namespace domain {

const char* operationName(OperationKind kind) {
  switch (kind) {
    case OperationKind::Deposit:
      return "deposit";
    case OperationKind::Withdraw:
      return "withdraw";
    case OperationKind::Mint:
      return "mint";
    case OperationKind::Burn:
      return "burn";
    case OperationKind::Close:
      return "close";
  }
  return "unknown";
}

std::optional<OperationKind> parseOperationKind(std::string_view name) {
  if (name == "deposit") return OperationKind::Deposit;
  if (name == "withdraw") return OperationKind::Withdraw;
  if (name == "mint") return OperationKind::Mint;
  if (name == "burn") return OperationKind::Burn;
  if (name == "close") return OperationKind::Close;
  return std::nullopt;
}

}  // namespace domain
}  // namespace cdp
