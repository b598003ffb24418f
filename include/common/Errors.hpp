#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sbu::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: input validation failures.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found: requested release or artifact does not exist.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 409 Conflict: insert attempted for a version name already in the catalog.
struct DuplicateVersionError : AppError {
  explicit DuplicateVersionError(std::string sCode, std::string sMsg)
      : AppError(409, std::move(sCode), std::move(sMsg)) {}
};

/// 502 Bad Gateway: upstream release API unreachable, rejected or malformed.
struct UpstreamFetchError : AppError {
  explicit UpstreamFetchError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

/// 502 Bad Gateway: object store upload or delete failure.
struct StorageError : AppError {
  explicit StorageError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error: checkout, pull, log or worktree failure.
struct SourceControlError : AppError {
  explicit SourceControlError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error: no commit exists before the weekly cutoff.
struct NoEligibleCommitError : AppError {
  explicit NoEligibleCommitError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error: build command failed or produced no artifacts.
struct BuildError : AppError {
  explicit BuildError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

/// 503 Service Unavailable: sync pass aborted by a stop request.
struct CancelledError : AppError {
  explicit CancelledError(std::string sCode, std::string sMsg)
      : AppError(503, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace sbu::common
