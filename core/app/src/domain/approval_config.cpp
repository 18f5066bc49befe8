#include "depot/domain/approval_config.hpp"

#include <cstring>

namespace depot {
namespace domain {

const char* toString(OperationMode mode) {
  switch (mode) {
    case OperationMode::Autonomous: return "autonomous";
    case OperationMode::Supervised: return "supervised";
  }
  return "unknown";
}

bool parseOperationMode(const char* text, OperationMode& out) {
  if (text == nullptr) {
    return false;
  }
  if (std::strcmp(text, "autonomous") == 0) {
    out = OperationMode::Autonomous;
    return true;
  }
  if (std::strcmp(text, "supervised") == 0) {
    out = OperationMode::Supervised;
    return true;
  }
  return false;
}

}  // namespace domain
}  // namespace depot
