#include "vault/utils/ErrorHandling.hh"
#include "vault/core/Log.hh"

namespace vault {

VaultException::VaultException(const std::string &message)
    : message(message) {}

const char *VaultException::what() const noexcept { return message.c_str(); }

void throwError(const std::string &message) {
  VAULT_LOG_ERROR("VaultException: {}", message);
  throw VaultException(message);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::AlreadyExists:
    return "AlreadyExists";
  case ErrorCode::DeviceUnavailable:
    return "DeviceUnavailable";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace vault
