#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ldp::common {

/// Base error for all application-level exceptions.
/// Carries a process exit code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iExitCode;
  std::string _sErrorCode;

  explicit AppError(int iExitCode, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iExitCode(iExitCode),
        _sErrorCode(std::move(sCode)) {}
};

/// Exit 2 — invalid configuration or malformed input values.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(2, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 3 — a build step failed, or a deferred field was left unresolved.
struct BuildError : AppError {
  explicit BuildError(std::string sCode, std::string sMsg)
      : AppError(3, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 4 — upstream cloud API error.
struct ProviderError : AppError {
  explicit ProviderError(std::string sCode, std::string sMsg)
      : AppError(4, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 4 — the queried cloud resource does not exist.
/// Remote state queries treat this as an expected outcome.
struct ResourceNotFoundError : ProviderError {
  explicit ResourceNotFoundError(std::string sCode, std::string sMsg)
      : ProviderError(std::move(sCode), std::move(sMsg)) {}
};

/// Exit 4 — a Lambda call failed while uploading function code.
/// Records which client method and function were involved.
struct LambdaClientError : ProviderError {
  std::string _sClientMethod;
  std::string _sFunctionName;

  explicit LambdaClientError(std::string sClientMethod, std::string sFunctionName,
                             std::string sMsg)
      : ProviderError("lambda_client_error", std::move(sMsg)),
        _sClientMethod(std::move(sClientMethod)),
        _sFunctionName(std::move(sFunctionName)) {}
};

/// Exit 5 — a deployed value was requested for a resource with no record.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(5, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 6 — persisted deployment state is corrupt or from an incompatible schema.
struct StateError : AppError {
  explicit StateError(std::string sCode, std::string sMsg)
      : AppError(6, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 7 — a cloud API failure surfaced while deploying.
/// Wraps the ProviderError with a user-facing location and message.
struct DeploymentError : AppError {
  explicit DeploymentError(std::string sCode, std::string sMsg)
      : AppError(7, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 70 — closed-set violation or other programming defect.
struct InternalError : AppError {
  explicit InternalError(std::string sCode, std::string sMsg)
      : AppError(70, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 70 — a placeholder value reached the executor.
/// The key and method name are filled in as the error propagates.
struct UnresolvedValueError : AppError {
  std::string _sKey;
  std::string _sValue;
  std::string _sMethodName;

  explicit UnresolvedValueError(std::string sKey, std::string sValue, std::string sMethodName)
      : AppError(70, "unresolved_value", formatMessage(sKey, sValue, sMethodName)),
        _sKey(std::move(sKey)),
        _sValue(std::move(sValue)),
        _sMethodName(std::move(sMethodName)) {}

  /// Rebuild with extra context; std::runtime_error's message is immutable.
  UnresolvedValueError withKey(std::string sKey) const {
    return UnresolvedValueError(std::move(sKey), _sValue, _sMethodName);
  }
  UnresolvedValueError withMethodName(std::string sMethodName) const {
    return UnresolvedValueError(_sKey, _sValue, std::move(sMethodName));
  }

 private:
  static std::string formatMessage(const std::string& sKey, const std::string& sValue,
                                   const std::string& sMethodName) {
    return "The API parameter '" + sKey + "' has an unresolved value of " + sValue +
           " in the method call: " + sMethodName;
  }
};

}  // namespace ldp::common
