#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind { NotFound, Unauthorized, AlreadyExists, InvalidInput, Serialization };

const char* ErrorKindToString(ErrorKind kind);

// Thrown by every contract operation. A throw aborts the invocation; the
// dispatcher discards any buffered writes.
class ContractError : public std::runtime_error {
public:
  ContractError(ErrorKind kind, const std::string& message);
  ErrorKind Kind() const { return kind_; }

  static ContractError NotFound(const std::string& what);
  static ContractError Unauthorized();
  static ContractError AlreadyExists(const std::string& what);
  static ContractError InvalidInput(const std::string& what);
  static ContractError Serialization(const std::string& what);
private:
  ErrorKind kind_;
};
