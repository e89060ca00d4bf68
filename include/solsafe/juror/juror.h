// SOLSAFE - Juror Workflow
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// The commit/reveal sequence a juror runs for one case:
//
//   Commit()         generate, persist the secret, hand back the public half
//   PrepareReveal()  load the secret and check it still opens the commitment
//   ConfirmReveal()  drop the secret once the reveal is on-chain

#ifndef SOLSAFE_JUROR_JUROR_H
#define SOLSAFE_JUROR_JUROR_H

#include "solsafe/core/json.h"
#include "solsafe/store/commitment_store.h"
#include "solsafe/vote/commitment.h"

#include <optional>

namespace solsafe {
namespace juror {

/// What the juror submits with the commit transaction
struct PublicVote {
    CaseId caseId{0};
    Hash256 commitment;
    Hash256 nullifier;

    JSONValue ToJSONValue() const;
};

/// What the juror submits with the reveal transaction
struct RevealPayload {
    CaseId caseId{0};
    bool vote{false};
    vote::Salt salt{};
    Hash256 commitment;

    JSONValue ToJSONValue() const;
};

class Juror {
public:
    explicit Juror(store::CommitmentStore& store) : store_(store) {}

    /**
     * Commit to vote on caseId.
     * @param salt Explicit 32-byte salt; a random one is drawn if absent
     * @param overwrite Replace an unrevealed commitment for the same case
     * @throws std::logic_error if a commitment already exists and overwrite
     *         is false
     */
    PublicVote Commit(CaseId caseId, bool vote,
                      const std::optional<Bytes>& salt = std::nullopt,
                      bool overwrite = false);

    /**
     * Reveal data for caseId, or nullopt if the juror never committed.
     * @throws IntegrityError if the stored secret is damaged or no longer
     *         opens its own commitment
     */
    std::optional<RevealPayload> PrepareReveal(CaseId caseId);

    /// Forget the secret once the reveal has been submitted
    void ConfirmReveal(CaseId caseId);

private:
    store::CommitmentStore& store_;
};

} // namespace juror
} // namespace solsafe

#endif // SOLSAFE_JUROR_JUROR_H
