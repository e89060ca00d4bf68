// SOLSAFE - Evidence Merkle Commitment
// Copyright (c) 2024 SOLSAFE Developers
// MIT License
//
// Batches an ordered list of evidence items into a single 32-byte root that
// can be anchored on-chain, plus one inclusion proof per item.
//
//   leaf[i] = H("LEAF:" || item[i])
//   parent  = H("NODE:" || left || right)
//
// A level with an odd number of nodes pairs its last node with itself. The
// order of items is part of the commitment.

#ifndef SOLSAFE_EVIDENCE_MERKLE_H
#define SOLSAFE_EVIDENCE_MERKLE_H

#include "solsafe/core/types.h"

#include <cstdint>
#include <vector>

namespace solsafe {
namespace evidence {

// ============================================================================
// Types
// ============================================================================

/// Sibling digests from the leaf level up to (not including) the root
struct MerkleProof {
    uint64_t index{0};
    std::vector<Hash256> siblings;

    bool operator==(const MerkleProof& other) const {
        return index == other.index && siblings == other.siblings;
    }
};

/// Result of committing to a set of items. The intermediate tree levels are
/// discarded once the proofs have been extracted.
struct MerkleCommitment {
    Hash256 root;
    std::vector<Hash256> leaves;
    std::vector<MerkleProof> proofs;   // proofs[i] proves leaves[i]

    size_t LeafCount() const { return leaves.size(); }
};

// ============================================================================
// Hashing
// ============================================================================

/// H("LEAF:" || item)
Hash256 HashLeaf(ByteSpan item);

/// H("NODE:" || left || right)
Hash256 HashNode(const Hash256& left, const Hash256& right);

/// ceil(log2(leafCount)); 0 for a single leaf
size_t MerkleProofLength(size_t leafCount);

// ============================================================================
// Commitment
// ============================================================================

/// Build the root and every proof for items.
/// Throws EmptyInputError if items is empty.
MerkleCommitment BuildMerkleCommitment(const std::vector<Bytes>& items);

/// Same, starting from already-hashed leaves
MerkleCommitment BuildMerkleCommitmentFromLeaves(std::vector<Hash256> leaves);

/// Root only. Throws EmptyInputError if leaves is empty.
Hash256 ComputeMerkleRoot(std::vector<Hash256> leaves);

// ============================================================================
// Verification
// ============================================================================

/// Check that item sits at index under root. Returns false for any
/// mismatch, including an index too large for the proof; never throws.
bool VerifyMerkleProof(ByteSpan item, const Hash256& root,
                       const std::vector<Hash256>& siblings, uint64_t index);

/// Same check for a leaf digest that was already computed with HashLeaf()
bool VerifyMerkleLeaf(const Hash256& leaf, const Hash256& root,
                      const std::vector<Hash256>& siblings, uint64_t index);

inline bool VerifyMerkleProof(ByteSpan item, const Hash256& root, const MerkleProof& proof) {
    return VerifyMerkleProof(item, root, proof.siblings, proof.index);
}

} // namespace evidence
} // namespace solsafe

#endif // SOLSAFE_EVIDENCE_MERKLE_H
