#include "common/errors.hpp"

const char* ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::Unauthorized: return "unauthorized";
    case ErrorKind::AlreadyExists: return "already_exists";
    case ErrorKind::InvalidInput: return "invalid_input";
    case ErrorKind::Serialization: return "serialization";
  }
  return "unknown";
}

ContractError::ContractError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

ContractError ContractError::NotFound(const std::string& what) {
  return ContractError(ErrorKind::NotFound, what);
}

ContractError ContractError::Unauthorized() {
  return ContractError(ErrorKind::Unauthorized, "Unauthorized");
}

ContractError ContractError::AlreadyExists(const std::string& what) {
  return ContractError(ErrorKind::AlreadyExists, what);
}

ContractError ContractError::InvalidInput(const std::string& what) {
  return ContractError(ErrorKind::InvalidInput, "Invalid input: " + what);
}

ContractError ContractError::Serialization(const std::string& what) {
  return ContractError(ErrorKind::Serialization, "Error parsing stored data: " + what);
}
