// SOLSAFE - Evidence Bundle
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// The metadata document a reporter uploads to content storage next to the
// raw evidence files. It records the case, one descriptor per file, the
// Merkle root that is anchored on-chain and each file's inclusion proof, so
// anyone who later fetches a single file can check it against the root
// without the other files.

#ifndef SOLSAFE_EVIDENCE_BUNDLE_H
#define SOLSAFE_EVIDENCE_BUNDLE_H

#include "solsafe/core/json.h"
#include "solsafe/core/types.h"
#include "solsafe/evidence/merkle.h"

#include <cstdint>
#include <string>
#include <vector>

namespace solsafe {
namespace evidence {

/// Longest accepted case description or evidence locator
constexpr size_t MAX_EVIDENCE_TEXT_LENGTH = 500;

/// Locator prefix for evidence held as a zero-knowledge proof reference
constexpr const char* ZKPROOF_LOCATOR_PREFIX = "zkproof:";

/// Where one raw evidence file lives in external storage
struct EvidenceDescriptor {
    std::string name;
    std::string mediaType;
    std::string locator;    // URL (https://, ipfs://, ar://) or zkproof:<hash>
};

/// Input to EvidenceBundle::Build
struct EvidenceItem {
    EvidenceDescriptor descriptor;
    Bytes content;
};

/// Case metadata carried by the bundle
struct BundleHeader {
    CaseId caseId{0};
    std::string reporter;      // reporter wallet address
    std::string subject;       // reported address
    std::string description;
    Timestamp createdAt{0};
};

/// One committed file
struct BundleEntry {
    uint64_t index{0};
    EvidenceDescriptor descriptor;
    uint64_t size{0};
    Hash256 leaf;
    std::vector<Hash256> proof;
};

/// Check a locator: non-empty, at most MAX_EVIDENCE_TEXT_LENGTH characters,
/// and either zkproof:<something> or scheme://<something>
bool IsValidEvidenceLocator(const std::string& locator);

class EvidenceBundle {
public:
    static constexpr int64_t VERSION = 1;

    /// Commit to items in order.
    /// Throws EmptyInputError for no items and std::invalid_argument for a
    /// zero case id, an over-long description or an invalid locator.
    static EvidenceBundle Build(const BundleHeader& header,
                                const std::vector<EvidenceItem>& items);

    /// Parse and structurally validate a bundle document.
    /// Throws std::invalid_argument on any malformed or inconsistent field.
    static EvidenceBundle FromJSON(const std::string& json);

    const BundleHeader& Header() const { return header_; }
    const Hash256& Root() const { return root_; }
    const std::vector<BundleEntry>& Entries() const { return entries_; }
    size_t ItemCount() const { return entries_.size(); }

    /// Check fetched file content against this bundle's own root
    bool VerifyItem(uint64_t index, ByteSpan content) const;

    /// Check fetched file content against a root read from the chain
    bool VerifyItem(uint64_t index, ByteSpan content, const Hash256& anchoredRoot) const;

    /// Structural consistency: dense ordered indices, proof lengths, every
    /// leaf proven under the root. On failure reason says what is wrong.
    bool Validate(std::string* reason = nullptr) const;

    JSONValue ToJSONValue() const;

    /// Canonical (sorted keys, compact) unless pretty is set
    std::string ToJSON(bool pretty = false) const;

    /// SHA-256 of the canonical JSON; identifies the uploaded document
    Hash256 DocumentDigest() const;

private:
    EvidenceBundle() = default;

    BundleHeader header_;
    Hash256 root_;
    std::vector<BundleEntry> entries_;
};

} // namespace evidence
} // namespace solsafe

#endif // SOLSAFE_EVIDENCE_BUNDLE_H
