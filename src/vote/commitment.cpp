// SOLSAFE - Vote Commitment Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/vote/commitment.h"
#include "solsafe/core/random.h"
#include "solsafe/core/serialize.h"
#include "solsafe/crypto/sha256.h"
#include "solsafe/crypto/tagged_hash.h"
#include "solsafe/util/logging.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace solsafe {
namespace vote {

namespace {

void CheckCaseId(CaseId caseId) {
    if (caseId == 0) {
        throw std::invalid_argument("case id must be at least 1");
    }
}

} // namespace

// ============================================================================
// Digests
// ============================================================================

Hash256 ComputeCommitment(bool vote, const Salt& salt) {
    const Byte voteByte = vote ? 1 : 0;
    return TaggedHash(DomainTag::COMMIT, {ByteSpan(&voteByte, 1), salt});
}

Hash256 ComputeNullifier(CaseId caseId, const Hash256& commitment) {
    const auto caseBytes = EncodeLE64(caseId);
    return TaggedHash(DomainTag::NULLIFIER, {caseBytes, commitment});
}

// ============================================================================
// VoteCommitment
// ============================================================================

VoteCommitment::VoteCommitment(CaseId caseId, bool vote, const Salt& salt)
    : caseId_(caseId), vote_(vote), salt_(salt) {
    CheckCaseId(caseId_);
    commitment_ = ComputeCommitment(vote_, salt_);
    nullifier_ = ComputeNullifier(caseId_, commitment_);
}

VoteCommitment::VoteCommitment(CaseId caseId, bool vote, const Salt& salt,
                               const Hash256& commitment, const Hash256& nullifier)
    : VoteCommitment(caseId, vote, salt) {
    if (commitment_ != commitment) {
        throw std::invalid_argument("commitment does not match vote and salt");
    }
    if (nullifier_ != nullifier) {
        throw std::invalid_argument("nullifier does not match case " + std::to_string(caseId));
    }
}

bool VoteCommitment::operator==(const VoteCommitment& other) const {
    return caseId_ == other.caseId_ && vote_ == other.vote_ && salt_ == other.salt_ &&
           commitment_ == other.commitment_ && nullifier_ == other.nullifier_;
}

std::string VoteCommitment::ToString() const {
    std::ostringstream oss;
    oss << "VoteCommitment(case=" << caseId_
        << ", commitment=" << commitment_.ToShortHex()
        << ", nullifier=" << nullifier_.ToShortHex() << ")";
    return oss.str();
}

// ============================================================================
// Generation and Verification
// ============================================================================

VoteCommitment GenerateVoteCommitment(CaseId caseId, bool vote,
                                      const std::optional<Bytes>& salt) {
    CheckCaseId(caseId);

    Salt s;
    if (salt) {
        if (salt->size() != SALT_SIZE) {
            throw std::invalid_argument("salt must be " + std::to_string(SALT_SIZE) +
                                        " bytes, got " + std::to_string(salt->size()));
        }
        std::copy(salt->begin(), salt->end(), s.begin());
    } else {
        s = GetRandArray<SALT_SIZE>();
    }

    VoteCommitment vc(caseId, vote, s);
    LOG_DEBUG(util::LogCategory::VOTE) << "Generated " << vc.ToString();
    return vc;
}

bool VerifyVoteReveal(const Hash256& commitment, bool vote, ByteSpan salt) {
    if (salt.size() != SALT_SIZE) {
        return false;
    }
    Salt s;
    std::copy(salt.begin(), salt.end(), s.begin());
    return ConstantTimeEqual(ComputeCommitment(vote, s), commitment);
}

// ============================================================================
// Serialization
// ============================================================================

Bytes SerializeVoteCommitment(const VoteCommitment& vc) {
    DataStream ss;
    ss << VoteCommitment::SCHEMA_VERSION;
    ss << static_cast<uint64_t>(vc.GetCaseId());
    ss << vc.GetVote();
    ss << vc.GetSalt();
    ss << vc.GetCommitment();
    ss << vc.GetNullifier();
    return ss.Data();
}

VoteCommitment DeserializeVoteCommitment(const Bytes& data) {
    DataStream ss(data);

    uint8_t version = 0;
    ss >> version;
    if (version != VoteCommitment::SCHEMA_VERSION) {
        throw std::invalid_argument("unsupported vote commitment version " +
                                    std::to_string(version));
    }

    uint64_t caseId = 0;
    bool vote = false;
    Salt salt;
    Hash256 commitment;
    Hash256 nullifier;
    ss >> caseId >> vote >> salt >> commitment >> nullifier;

    if (!ss.empty()) {
        throw std::invalid_argument("trailing bytes after vote commitment record");
    }
    return VoteCommitment(caseId, vote, salt, commitment, nullifier);
}

} // namespace vote
} // namespace solsafe
