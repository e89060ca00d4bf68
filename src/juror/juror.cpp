// SOLSAFE - Juror Workflow Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/juror/juror.h"
#include "solsafe/core/errors.h"
#include "solsafe/core/hex.h"
#include "solsafe/util/logging.h"

#include <stdexcept>

namespace solsafe {
namespace juror {

JSONValue PublicVote::ToJSONValue() const {
    JSONValue::Object obj;
    obj["caseId"] = JSONValue(caseId);
    obj["commitment"] = JSONValue(commitment.ToHex());
    obj["nullifier"] = JSONValue(nullifier.ToHex());
    return JSONValue(std::move(obj));
}

JSONValue RevealPayload::ToJSONValue() const {
    JSONValue::Object obj;
    obj["caseId"] = JSONValue(caseId);
    obj["vote"] = JSONValue(vote);
    obj["salt"] = JSONValue(BytesToHex(salt));
    obj["commitment"] = JSONValue(commitment.ToHex());
    return JSONValue(std::move(obj));
}

PublicVote Juror::Commit(CaseId caseId, bool vote, const std::optional<Bytes>& salt,
                         bool overwrite) {
    if (!overwrite && store_.Contains(caseId)) {
        throw std::logic_error("case " + std::to_string(caseId) +
                               " already has an unrevealed commitment");
    }

    vote::VoteCommitment vc = vote::GenerateVoteCommitment(caseId, vote, salt);
    store_.Save(caseId, vc);

    LOG_INFO(util::LogCategory::VOTE)
        << "Committed vote for case " << caseId << ", nullifier "
        << vc.GetNullifier().ToShortHex();
    return PublicVote{caseId, vc.GetCommitment(), vc.GetNullifier()};
}

std::optional<RevealPayload> Juror::PrepareReveal(CaseId caseId) {
    std::optional<vote::VoteCommitment> vc = store_.Load(caseId);
    if (!vc) {
        return std::nullopt;
    }

    // Load() already refuses a record whose digests disagree with (vote, salt);
    // this repeats the check with the verifier the chain will run
    if (!vote::VerifyVoteReveal(vc->GetCommitment(), vc->GetVote(), vc->GetSalt())) {
        LOG_ERROR(util::LogCategory::VOTE)
            << "Stored secret for case " << caseId << " does not open its commitment";
        throw IntegrityError(store::CommitmentStore::RecordKey(caseId),
                             "stored secret does not open its commitment");
    }

    return RevealPayload{caseId, vc->GetVote(), vc->GetSalt(), vc->GetCommitment()};
}

void Juror::ConfirmReveal(CaseId caseId) {
    store_.Remove(caseId);
    LOG_INFO(util::LogCategory::VOTE) << "Reveal confirmed for case " << caseId;
}

} // namespace juror
} // namespace solsafe
