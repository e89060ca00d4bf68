// SOLSAFE - Evidence Bundle Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/evidence/bundle.h"
#include "solsafe/core/errors.h"
#include "solsafe/crypto/sha256.h"
#include "solsafe/util/logging.h"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace solsafe {
namespace evidence {

// ============================================================================
// Validation Helpers
// ============================================================================

namespace {

bool IsSchemeChar(unsigned char c, bool first) {
    if (std::isalpha(c)) return true;
    if (first) return false;
    return std::isdigit(c) || c == '+' || c == '-' || c == '.';
}

bool HasWhitespace(const std::string& str) {
    for (unsigned char c : str) {
        if (std::isspace(c) || std::iscntrl(c)) return true;
    }
    return false;
}

void CheckHeader(const BundleHeader& header) {
    if (header.caseId == 0 ||
        header.caseId > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw std::invalid_argument("case id out of range: " + std::to_string(header.caseId));
    }
    if (header.description.size() > MAX_EVIDENCE_TEXT_LENGTH) {
        throw std::invalid_argument("description exceeds " +
                                    std::to_string(MAX_EVIDENCE_TEXT_LENGTH) + " characters");
    }
}

std::vector<Hash256> ParseDigestArray(const JSONValue::Array& arr, const std::string& what) {
    std::vector<Hash256> out;
    out.reserve(arr.size());
    for (const JSONValue& v : arr) {
        if (!v.IsString()) {
            throw std::invalid_argument(what + ": expected hex string");
        }
        out.push_back(Hash256::FromHex(v.GetString()));
    }
    return out;
}

} // namespace

bool IsValidEvidenceLocator(const std::string& locator) {
    if (locator.empty() || locator.size() > MAX_EVIDENCE_TEXT_LENGTH) {
        return false;
    }
    if (HasWhitespace(locator)) {
        return false;
    }

    const std::string zk = ZKPROOF_LOCATOR_PREFIX;
    if (locator.compare(0, zk.size(), zk) == 0) {
        return locator.size() > zk.size();
    }

    size_t sep = locator.find("://");
    if (sep == std::string::npos || sep == 0 || sep + 3 >= locator.size()) {
        return false;
    }
    for (size_t i = 0; i < sep; ++i) {
        if (!IsSchemeChar(static_cast<unsigned char>(locator[i]), i == 0)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Construction
// ============================================================================

EvidenceBundle EvidenceBundle::Build(const BundleHeader& header,
                                     const std::vector<EvidenceItem>& items) {
    if (items.empty()) {
        throw EmptyInputError("evidence bundle needs at least one item");
    }
    CheckHeader(header);

    std::vector<Bytes> contents;
    contents.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        const EvidenceDescriptor& desc = items[i].descriptor;
        if (!IsValidEvidenceLocator(desc.locator)) {
            throw std::invalid_argument("item " + std::to_string(i) +
                                        ": invalid evidence locator '" + desc.locator + "'");
        }
        contents.push_back(items[i].content);
    }

    MerkleCommitment commitment = BuildMerkleCommitment(contents);

    EvidenceBundle bundle;
    bundle.header_ = header;
    bundle.root_ = commitment.root;
    bundle.entries_.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        BundleEntry entry;
        entry.index = i;
        entry.descriptor = items[i].descriptor;
        entry.size = items[i].content.size();
        entry.leaf = commitment.leaves[i];
        entry.proof = std::move(commitment.proofs[i].siblings);
        bundle.entries_.push_back(std::move(entry));
    }

    LOG_INFO(util::LogCategory::EVIDENCE)
        << "Built evidence bundle for case " << header.caseId << " with "
        << bundle.entries_.size() << " item(s), root " << bundle.root_.ToHex();
    return bundle;
}

// ============================================================================
// Verification
// ============================================================================

bool EvidenceBundle::VerifyItem(uint64_t index, ByteSpan content) const {
    return VerifyItem(index, content, root_);
}

bool EvidenceBundle::VerifyItem(uint64_t index, ByteSpan content,
                                const Hash256& anchoredRoot) const {
    if (index >= entries_.size()) {
        return false;
    }
    const BundleEntry& entry = entries_[index];
    if (content.size() != entry.size) {
        LOG_DEBUG(util::LogCategory::EVIDENCE)
            << "Item " << index << " size mismatch: got " << content.size()
            << ", expected " << entry.size;
        return false;
    }
    Hash256 leaf = HashLeaf(content);
    if (leaf != entry.leaf) {
        return false;
    }
    return VerifyMerkleLeaf(leaf, anchoredRoot, entry.proof, entry.index);
}

bool EvidenceBundle::Validate(std::string* reason) const {
    auto fail = [reason](const std::string& msg) {
        if (reason) *reason = msg;
        return false;
    };

    if (entries_.empty()) {
        return fail("bundle has no items");
    }

    const size_t expectedDepth = MerkleProofLength(entries_.size());
    std::vector<Hash256> leaves;
    leaves.reserve(entries_.size());

    for (size_t i = 0; i < entries_.size(); ++i) {
        const BundleEntry& entry = entries_[i];
        if (entry.index != i) {
            return fail("item " + std::to_string(i) + " has index " +
                        std::to_string(entry.index));
        }
        if (entry.proof.size() != expectedDepth) {
            return fail("item " + std::to_string(i) + " proof has " +
                        std::to_string(entry.proof.size()) + " siblings, expected " +
                        std::to_string(expectedDepth));
        }
        if (!IsValidEvidenceLocator(entry.descriptor.locator)) {
            return fail("item " + std::to_string(i) + " has an invalid locator");
        }
        if (!VerifyMerkleLeaf(entry.leaf, root_, entry.proof, entry.index)) {
            return fail("item " + std::to_string(i) + " is not proven under the root");
        }
        leaves.push_back(entry.leaf);
    }

    if (ComputeMerkleRoot(std::move(leaves)) != root_) {
        return fail("leaves do not recompute to the root");
    }
    return true;
}

// ============================================================================
// Serialization
// ============================================================================

JSONValue EvidenceBundle::ToJSONValue() const {
    JSONValue::Array items;
    for (const BundleEntry& entry : entries_) {
        JSONValue::Array proof;
        for (const Hash256& sibling : entry.proof) {
            proof.emplace_back(sibling.ToHex());
        }

        JSONValue::Object item;
        item["index"] = JSONValue(entry.index);
        item["name"] = JSONValue(entry.descriptor.name);
        item["mediaType"] = JSONValue(entry.descriptor.mediaType);
        item["locator"] = JSONValue(entry.descriptor.locator);
        item["size"] = JSONValue(entry.size);
        item["leaf"] = JSONValue(entry.leaf.ToHex());
        item["proof"] = JSONValue(std::move(proof));
        items.emplace_back(std::move(item));
    }

    JSONValue::Object doc;
    doc["version"] = JSONValue(VERSION);
    doc["caseId"] = JSONValue(header_.caseId);
    doc["reporter"] = JSONValue(header_.reporter);
    doc["subject"] = JSONValue(header_.subject);
    doc["description"] = JSONValue(header_.description);
    doc["createdAt"] = JSONValue(header_.createdAt);
    doc["merkleRoot"] = JSONValue(root_.ToHex());
    doc["items"] = JSONValue(std::move(items));
    return JSONValue(std::move(doc));
}

std::string EvidenceBundle::ToJSON(bool pretty) const {
    return ToJSONValue().ToJSON(pretty);
}

Hash256 EvidenceBundle::DocumentDigest() const {
    std::string canonical = ToJSON(false);
    return SHA256Hash(reinterpret_cast<const Byte*>(canonical.data()), canonical.size());
}

EvidenceBundle EvidenceBundle::FromJSON(const std::string& json) {
    JSONValue doc = JSONValue::Parse(json);
    if (!doc.IsObject()) {
        throw std::invalid_argument("evidence bundle must be a JSON object");
    }

    int64_t version = doc.RequireInt("version");
    if (version != VERSION) {
        throw std::invalid_argument("unsupported evidence bundle version " +
                                    std::to_string(version));
    }

    int64_t caseId = doc.RequireInt("caseId");
    if (caseId <= 0) {
        throw std::invalid_argument("case id out of range: " + std::to_string(caseId));
    }

    EvidenceBundle bundle;
    bundle.header_.caseId = static_cast<CaseId>(caseId);
    bundle.header_.reporter = doc.RequireString("reporter");
    bundle.header_.subject = doc.RequireString("subject");
    bundle.header_.description = doc.RequireString("description");
    bundle.header_.createdAt = doc.RequireInt("createdAt");
    CheckHeader(bundle.header_);

    bundle.root_ = Hash256::FromHex(doc.RequireString("merkleRoot"));

    for (const JSONValue& item : doc.RequireArray("items")) {
        if (!item.IsObject()) {
            throw std::invalid_argument("evidence item must be a JSON object");
        }
        int64_t index = item.RequireInt("index");
        int64_t size = item.RequireInt("size");
        if (index < 0 || size < 0) {
            throw std::invalid_argument("evidence item index and size must be non-negative");
        }

        BundleEntry entry;
        entry.index = static_cast<uint64_t>(index);
        entry.size = static_cast<uint64_t>(size);
        entry.descriptor.name = item.RequireString("name");
        entry.descriptor.mediaType = item.RequireString("mediaType");
        entry.descriptor.locator = item.RequireString("locator");
        entry.leaf = Hash256::FromHex(item.RequireString("leaf"));
        entry.proof = ParseDigestArray(item.RequireArray("proof"), "proof");
        bundle.entries_.push_back(std::move(entry));
    }

    std::string reason;
    if (!bundle.Validate(&reason)) {
        throw std::invalid_argument("inconsistent evidence bundle: " + reason);
    }
    return bundle;
}

} // namespace evidence
} // namespace solsafe
