#include "depot/domain/transfer_status.hpp"

#include <cstring>

namespace depot {
namespace domain {

// -----------------------------------------------------------------------------
// toString
// -----------------------------------------------------------------------------
const char* toString(TransferStatus status) {
  using S = TransferStatus;
  switch (status) {
    case S::Pending:          return "pending";
    case S::AwaitingApproval: return "awaiting_approval";
    case S::Approved:         return "approved";
    case S::Completed:        return "completed";
    case S::Failed:           return "failed";
    case S::Rejected:         return "rejected";
    case S::RolledBack:       return "rolled_back";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// parseTransferStatus
// -----------------------------------------------------------------------------
bool parseTransferStatus(const char* text, TransferStatus& out) {
  using S = TransferStatus;
  static constexpr S kAll[] = {S::Pending,   S::AwaitingApproval,
                               S::Approved,  S::Completed,
                               S::Failed,    S::Rejected,
                               S::RolledBack};
  if (text == nullptr) {
    return false;
  }
  for (S candidate : kAll) {
    if (std::strcmp(text, toString(candidate)) == 0) {
      out = candidate;
      return true;
    }
  }
  return false;
}

// -----------------------------------------------------------------------------
// isTerminal
// -----------------------------------------------------------------------------
bool isTerminal(TransferStatus status) {
  using S = TransferStatus;
  return status == S::Completed ||
         status == S::Failed ||
         status == S::Rejected ||
         status == S::RolledBack;
}

// -----------------------------------------------------------------------------
// canTransition: the transfer lifecycle graph
// -----------------------------------------------------------------------------
bool canTransition(TransferStatus current, TransferStatus next) {
  using S = TransferStatus;

  switch (current) {
    case S::Pending:
      return next == S::AwaitingApproval ||
             next == S::Completed ||
             next == S::Failed ||
             next == S::RolledBack;

    case S::AwaitingApproval:
      return next == S::Approved ||
             next == S::Rejected;

    // An approved transfer still runs the commit, which can refuse
    // (stock moved while it sat in the queue) or roll back.
    case S::Approved:
      return next == S::Completed ||
             next == S::Failed ||
             next == S::RolledBack;

    case S::Completed:
    case S::Failed:
    case S::Rejected:
    case S::RolledBack:
      return false;
  }

  return false;
}

}  // namespace domain
}  // namespace depot
