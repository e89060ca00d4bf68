// SOLSAFE - Error Types
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Exceptions raised by the evidence and vote layers.
//
// - Structurally invalid input (wrong-length salt or digest, case id 0,
//   malformed JSON) is reported with std::invalid_argument.
// - Verification failures are never exceptions; verifiers return bool.
// - Absence is never an exception; lookups return std::nullopt.

#ifndef SOLSAFE_CORE_ERRORS_H
#define SOLSAFE_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace solsafe {

/// A Merkle commitment or evidence bundle was requested over zero items
class EmptyInputError : public std::invalid_argument {
public:
    explicit EmptyInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// Persisted data failed its checksum or could not be decoded.
/// Never repaired silently.
class IntegrityError : public std::runtime_error {
public:
    IntegrityError(const std::string& key, const std::string& what)
        : std::runtime_error("integrity failure for '" + key + "': " + what),
          key_(key) {}

    /// Store key of the damaged entry
    const std::string& Key() const noexcept { return key_; }

private:
    std::string key_;
};

/// The storage backend failed to read or write
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace solsafe

#endif // SOLSAFE_CORE_ERRORS_H
