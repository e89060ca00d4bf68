// SOLSAFE - Evidence Merkle Commitment Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/evidence/merkle.h"
#include "solsafe/core/errors.h"
#include "solsafe/crypto/tagged_hash.h"
#include "solsafe/util/logging.h"

namespace solsafe {
namespace evidence {

// ============================================================================
// Hashing
// ============================================================================

Hash256 HashLeaf(ByteSpan item) {
    return TaggedHash(DomainTag::LEAF, {item});
}

Hash256 HashNode(const Hash256& left, const Hash256& right) {
    return TaggedHash(DomainTag::NODE, {left, right});
}

size_t MerkleProofLength(size_t leafCount) {
    size_t depth = 0;
    size_t width = 1;
    while (width < leafCount) {
        width <<= 1;
        ++depth;
    }
    return depth;
}

namespace {

/// Next level up. An odd last node is paired with itself.
std::vector<Hash256> BuildParentLevel(const std::vector<Hash256>& level) {
    std::vector<Hash256> parents;
    parents.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
        const Hash256& left = level[i];
        const Hash256& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
        parents.push_back(HashNode(left, right));
    }
    return parents;
}

} // namespace

// ============================================================================
// Commitment
// ============================================================================

MerkleCommitment BuildMerkleCommitmentFromLeaves(std::vector<Hash256> leaves) {
    if (leaves.empty()) {
        throw EmptyInputError("cannot commit to an empty evidence set");
    }

    const size_t count = leaves.size();

    MerkleCommitment result;
    result.proofs.resize(count);
    for (size_t i = 0; i < count; ++i) {
        result.proofs[i].index = i;
        result.proofs[i].siblings.reserve(MerkleProofLength(count));
    }

    // Walk up level by level. positions[i] tracks where leaf i's ancestor
    // sits in the current level.
    std::vector<size_t> positions(count);
    for (size_t i = 0; i < count; ++i) {
        positions[i] = i;
    }

    std::vector<Hash256> level = leaves;
    while (level.size() > 1) {
        for (size_t i = 0; i < count; ++i) {
            size_t pos = positions[i];
            size_t sibling = pos ^ 1;
            if (sibling >= level.size()) {
                sibling = pos;
            }
            result.proofs[i].siblings.push_back(level[sibling]);
            positions[i] = pos / 2;
        }
        level = BuildParentLevel(level);
    }

    result.root = level.front();
    result.leaves = std::move(leaves);

    LOG_DEBUG(util::LogCategory::EVIDENCE)
        << "Committed " << count << " evidence item(s), root " << result.root.ToShortHex();
    return result;
}

MerkleCommitment BuildMerkleCommitment(const std::vector<Bytes>& items) {
    if (items.empty()) {
        throw EmptyInputError("cannot commit to an empty evidence set");
    }

    std::vector<Hash256> leaves;
    leaves.reserve(items.size());
    for (const Bytes& item : items) {
        leaves.push_back(HashLeaf(item));
    }
    return BuildMerkleCommitmentFromLeaves(std::move(leaves));
}

Hash256 ComputeMerkleRoot(std::vector<Hash256> leaves) {
    if (leaves.empty()) {
        throw EmptyInputError("cannot commit to an empty evidence set");
    }
    while (leaves.size() > 1) {
        leaves = BuildParentLevel(leaves);
    }
    return leaves.front();
}

// ============================================================================
// Verification
// ============================================================================

bool VerifyMerkleLeaf(const Hash256& leaf, const Hash256& root,
                      const std::vector<Hash256>& siblings, uint64_t index) {
    Hash256 current = leaf;
    for (const Hash256& sibling : siblings) {
        current = (index & 1) ? HashNode(sibling, current) : HashNode(current, sibling);
        index >>= 1;
    }

    // Any bits left over mean the index addresses a leaf outside the tree
    return index == 0 && current == root;
}

bool VerifyMerkleProof(ByteSpan item, const Hash256& root,
                       const std::vector<Hash256>& siblings, uint64_t index) {
    return VerifyMerkleLeaf(HashLeaf(item), root, siblings, index);
}

} // namespace evidence
} // namespace solsafe
