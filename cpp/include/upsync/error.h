#pragma once

#include <stdexcept>
#include <string>

namespace upsync {

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all upsync exceptions.
class UpsyncError : public std::runtime_error {
public:
    explicit UpsyncError(const std::string& msg) : std::runtime_error(msg) {}
};

// ---------------------------------------------------------------------------
// Specific exception types
// ---------------------------------------------------------------------------

/// A path or ref was not found.
class NotFoundError : public UpsyncError {
public:
    explicit NotFoundError(const std::string& path)
        : UpsyncError("not found: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// A repo-relative path contains invalid segments (empty, `..`, absolute).
class InvalidPathError : public UpsyncError {
public:
    explicit InvalidPathError(const std::string& msg)
        : UpsyncError("invalid path: " + msg) {}
};

/// A low-level libgit2 operation failed.
class GitError : public UpsyncError {
public:
    explicit GitError(const std::string& msg)
        : UpsyncError("git error: " + msg) {}
};

/// A filesystem I/O error occurred.
class IoError : public UpsyncError {
public:
    explicit IoError(const std::string& msg)
        : UpsyncError("io error: " + msg) {}
};

/// The upstream remote could not be fetched (unreachable, timed out,
/// rejected credentials).  The transport-specific cause is only in the
/// message; callers treat every variant the same way.
class NetworkError : public UpsyncError {
public:
    explicit NetworkError(const std::string& msg)
        : UpsyncError("network error: " + msg) {}
};

/// A backup snapshot could not be completed.  No partial snapshot is left
/// behind when this is thrown.
class BackupError : public UpsyncError {
public:
    BackupError(const std::string& path, const std::string& msg)
        : UpsyncError("backup error: " + path + ": " + msg), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// Another process holds the sync lock.
class LockError : public UpsyncError {
public:
    explicit LockError(const std::string& msg)
        : UpsyncError("lock error: " + msg) {}
};

} // namespace upsync
