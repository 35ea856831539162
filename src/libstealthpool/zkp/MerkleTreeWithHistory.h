#pragma once

#include <libstealthpool/basics/base_uint.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace stealthpool {
namespace zkp {

class TreeFullError : public std::overflow_error {
public:
    TreeFullError() : std::overflow_error("Merkle tree is full") {}
};

/**
 * Append-only MiMC Merkle tree with a ring of recent roots.
 *
 * Only the rightmost filled subtree at each level is kept, so an insert
 * costs one hash per level. Empty subtrees hash to zeros[i] where
 * zeros[0] = H(0, 0) and zeros[i] = H(zeros[i-1], zeros[i-1]); the root of
 * an empty tree is zeros[levels].
 *
 * The last ROOT_HISTORY_SIZE roots are remembered so that a proof built
 * against a slightly stale root still verifies. The oldest root is evicted
 * silently.
 */
class MerkleTreeWithHistory {
public:
    static constexpr std::size_t MAX_LEVELS = 32;
    static constexpr std::size_t DEFAULT_LEVELS = 20;
    static constexpr std::size_t ROOT_HISTORY_SIZE = 30;

    struct RootHistory {
        std::array<uint256, ROOT_HISTORY_SIZE> roots;
        std::uint32_t currentRootIndex;
    };

    /** @throws std::invalid_argument unless 1 <= levels <= MAX_LEVELS */
    explicit MerkleTreeWithHistory(std::size_t levels = DEFAULT_LEVELS);

    /**
     * Append a leaf and record the new root.
     * @return index of the inserted leaf
     * @throws TreeFullError when all 2^levels leaves are used
     */
    std::uint64_t insert(const uint256& leaf);

    bool isFull() const { return nextIndex_ == capacity(); }

    /** False for the zero root; otherwise scans the ring newest first. */
    bool isKnownRoot(const uint256& root) const;

    uint256 getLastRoot() const { return roots_[currentRootIndex_]; }

    RootHistory rootHistory() const { return {roots_, currentRootIndex_}; }

    std::uint64_t nextIndex() const { return nextIndex_; }
    std::size_t levels() const { return levels_; }
    std::uint64_t capacity() const { return std::uint64_t{1} << levels_; }

    /** H(left, right) on tree nodes. */
    static uint256 hashLeftRight(const uint256& left, const uint256& right);

    /** zeros[i] for 0 <= i <= MAX_LEVELS. */
    static const uint256& zeros(std::size_t i);

private:
    std::size_t levels_;
    std::uint64_t nextIndex_ = 0;
    std::uint32_t currentRootIndex_ = 0;
    std::array<uint256, MAX_LEVELS> filledSubtrees_;
    std::array<uint256, ROOT_HISTORY_SIZE> roots_;
};

} // namespace zkp
} // namespace stealthpool
