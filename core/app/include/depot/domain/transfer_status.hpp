#pragma once

namespace depot {
namespace domain {

// -----------------------------------------------------------------------------
// TransferStatus: transfer lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Every state a TransferRequest can occupy.
//
// @details
// Legal transitions (enforced by canTransition()):
//
//   Pending ──────────> AwaitingApproval ───> Approved ───> Completed
//    │                       │                   │
//    │                       ▼                   ├──> Failed
//    ├──> Completed       Rejected               └──> RolledBack
//    ├──> Failed
//    └──> RolledBack
//
// Terminal states: Completed, Failed, Rejected, RolledBack.
// AwaitingApproval is the only state that waits on a human decision.
// -----------------------------------------------------------------------------
enum class TransferStatus {
  Pending,           // Created, not yet routed through the approval policy
  AwaitingApproval,  // Parked in the approval queue
  Approved,          // Approved by a human, commit about to run
  Completed,         // Both ledger cells updated (terminal)
  Failed,            // Commit refused for insufficient stock (terminal)
  Rejected,          // Rejected by a human (terminal)
  RolledBack,        // Commit reverted after an invariant check (terminal)
};

// -------------------------------------------------------------------------
// toString(status)
// -------------------------------------------------------------------------
// @brief  Lower-case wire name of the status, e.g. "awaiting_approval".
// -------------------------------------------------------------------------
const char* toString(TransferStatus status);

// -------------------------------------------------------------------------
// parseTransferStatus(text, out)
// -------------------------------------------------------------------------
// @brief  Inverse of toString(). Returns false for an unknown name and
//         leaves `out` untouched.
// -------------------------------------------------------------------------
bool parseTransferStatus(const char* text, TransferStatus& out);

// -------------------------------------------------------------------------
// isTerminal(status)
// -------------------------------------------------------------------------
// @return true for Completed, Failed, Rejected and RolledBack.
// -------------------------------------------------------------------------
bool isTerminal(TransferStatus status);

// -------------------------------------------------------------------------
// canTransition(current, next)
// -------------------------------------------------------------------------
// @brief  Validates a proposed status change against the graph above.
//
// @details
// Pure function. Terminal states have no outgoing edges.
// -------------------------------------------------------------------------
bool canTransition(TransferStatus current, TransferStatus next);

}  // namespace domain
}  // namespace depot
