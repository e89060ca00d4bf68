// SOLSAFE - Vote Commitment
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Commit/reveal for juror votes.
//
//   commitment = H("COMMIT:" || vote_byte || salt)
//   nullifier  = H("NULLIFIER:" || le64(caseId) || commitment)
//
// The commitment and nullifier are published when the juror votes. The vote
// and the 32-byte salt stay with the juror until the reveal, where anyone can
// recompute the commitment from them. The nullifier ties the commitment to a
// single case.

#ifndef SOLSAFE_VOTE_COMMITMENT_H
#define SOLSAFE_VOTE_COMMITMENT_H

#include "solsafe/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace solsafe {
namespace vote {

/// Salt length in bytes
constexpr size_t SALT_SIZE = 32;

using Salt = std::array<Byte, SALT_SIZE>;

// ============================================================================
// Vote Commitment
// ============================================================================

/**
 * A juror's vote together with the secret needed to open it.
 *
 * Instances are always internally consistent: the constructor recomputes the
 * commitment and nullifier and rejects a record whose stored digests do not
 * match its (caseId, vote, salt).
 */
class VoteCommitment {
public:
    /// Version byte at the start of the serialized record
    static constexpr uint8_t SCHEMA_VERSION = 1;

    /// Build from the secret half; digests are derived.
    /// Throws std::invalid_argument if caseId is 0.
    VoteCommitment(CaseId caseId, bool vote, const Salt& salt);

    /// Rebuild a stored record and check its digests.
    /// Throws std::invalid_argument if caseId is 0 or either digest does not
    /// match.
    VoteCommitment(CaseId caseId, bool vote, const Salt& salt,
                   const Hash256& commitment, const Hash256& nullifier);

    CaseId GetCaseId() const { return caseId_; }
    bool GetVote() const { return vote_; }
    const Salt& GetSalt() const { return salt_; }
    const Hash256& GetCommitment() const { return commitment_; }
    const Hash256& GetNullifier() const { return nullifier_; }

    bool operator==(const VoteCommitment& other) const;
    bool operator!=(const VoteCommitment& other) const { return !(*this == other); }

    /// Public half only, for log lines
    std::string ToString() const;

private:
    CaseId caseId_;
    bool vote_;
    Salt salt_;
    Hash256 commitment_;
    Hash256 nullifier_;
};

// ============================================================================
// Generation and Verification
// ============================================================================

/// H("COMMIT:" || vote_byte || salt)
Hash256 ComputeCommitment(bool vote, const Salt& salt);

/// H("NULLIFIER:" || le64(caseId) || commitment)
Hash256 ComputeNullifier(CaseId caseId, const Hash256& commitment);

/// Commit to vote for caseId. A fresh salt is drawn from the OS CSPRNG
/// unless one is given.
/// Throws std::invalid_argument for caseId 0 or a salt that is not
/// SALT_SIZE bytes.
VoteCommitment GenerateVoteCommitment(CaseId caseId, bool vote,
                                      const std::optional<Bytes>& salt = std::nullopt);

/// True iff (vote, salt) opens commitment. Any salt length other than
/// SALT_SIZE gives false.
bool VerifyVoteReveal(const Hash256& commitment, bool vote, ByteSpan salt);

// ============================================================================
// Serialization
// ============================================================================

/// Fixed-layout record:
///   u8 version | u64 caseId | u8 vote | salt[32] | commitment[32] | nullifier[32]
Bytes SerializeVoteCommitment(const VoteCommitment& vc);

/// Parse a record written by SerializeVoteCommitment().
/// Throws std::invalid_argument on an unknown version, trailing bytes or
/// inconsistent digests and std::ios_base::failure on truncation.
VoteCommitment DeserializeVoteCommitment(const Bytes& data);

} // namespace vote
} // namespace solsafe

#endif // SOLSAFE_VOTE_COMMITMENT_H
