#pragma once

#include <libstealthpool/basics/base_uint.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace stealthpool {
namespace zkp {

/**
 * Authentication path for one leaf, in the form the withdraw circuit takes.
 * pathIndices[i] is true when the running node is the right child at level i.
 */
struct MerklePath {
    uint256 root;
    std::uint64_t leafIndex = 0;
    std::vector<uint256> pathElements;
    std::vector<bool> pathIndices;
};

/**
 * Rebuild the path for leaves[leafIndex] from the ordered deposit log.
 * Missing nodes at level i are filled with zeros(i), so the result matches
 * MerkleTreeWithHistory after the same inserts.
 *
 * @throws std::out_of_range when leafIndex is not in leaves
 * @throws std::invalid_argument when leaves exceed the tree capacity
 */
MerklePath buildMerklePath(
    const std::vector<uint256>& leaves,
    std::uint64_t leafIndex,
    std::size_t levels);

/** Position of the first leaf equal to commitment. */
std::optional<std::uint64_t> findLeaf(
    const std::vector<uint256>& leaves,
    const uint256& commitment);

/** Fold leaf up the path. */
uint256 computeRoot(const uint256& leaf, const MerklePath& path);

bool verifyMerklePath(const uint256& leaf, const MerklePath& path);

} // namespace zkp
} // namespace stealthpool
