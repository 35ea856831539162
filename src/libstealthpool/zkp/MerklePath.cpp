#include <libstealthpool/zkp/MerklePath.h>

#include <libstealthpool/zkp/MerkleTreeWithHistory.h>

#include <algorithm>
#include <stdexcept>

namespace stealthpool {
namespace zkp {

MerklePath buildMerklePath(
    const std::vector<uint256>& leaves,
    std::uint64_t leafIndex,
    std::size_t levels) {
    if (levels == 0 || levels > MerkleTreeWithHistory::MAX_LEVELS) {
        throw std::invalid_argument("Tree levels must be in [1, 32]");
    }
    if (leaves.size() > (std::uint64_t{1} << levels)) {
        throw std::invalid_argument("More leaves than the tree can hold");
    }
    if (leafIndex >= leaves.size()) {
        throw std::out_of_range("Leaf index is not in the deposit log");
    }

    MerklePath path;
    path.leafIndex = leafIndex;
    path.pathElements.resize(levels);
    path.pathIndices.resize(levels);

    std::vector<uint256> layer = leaves;
    std::uint64_t index = leafIndex;

    for (std::size_t level = 0; level < levels; ++level) {
        const uint256& zero = MerkleTreeWithHistory::zeros(level);
        std::uint64_t const sibling = index ^ 1;

        path.pathIndices[level] = (index & 1) != 0;
        path.pathElements[level] = sibling < layer.size() ? layer[sibling] : zero;

        std::vector<uint256> next((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < next.size(); ++i) {
            const uint256& left = layer[2 * i];
            const uint256& right = 2 * i + 1 < layer.size() ? layer[2 * i + 1] : zero;
            next[i] = MerkleTreeWithHistory::hashLeftRight(left, right);
        }
        layer = std::move(next);
        index >>= 1;
    }

    path.root = layer.front();
    return path;
}

std::optional<std::uint64_t> findLeaf(
    const std::vector<uint256>& leaves,
    const uint256& commitment) {
    auto const it = std::find(leaves.begin(), leaves.end(), commitment);
    if (it == leaves.end()) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(it - leaves.begin());
}

uint256 computeRoot(const uint256& leaf, const MerklePath& path) {
    if (path.pathElements.size() != path.pathIndices.size()) {
        throw std::invalid_argument("Path elements and indices differ in length");
    }
    uint256 current = leaf;
    for (std::size_t level = 0; level < path.pathElements.size(); ++level) {
        if (path.pathIndices[level]) {
            current = MerkleTreeWithHistory::hashLeftRight(path.pathElements[level], current);
        } else {
            current = MerkleTreeWithHistory::hashLeftRight(current, path.pathElements[level]);
        }
    }
    return current;
}

bool verifyMerklePath(const uint256& leaf, const MerklePath& path) {
    return computeRoot(leaf, path) == path.root;
}

} // namespace zkp
} // namespace stealthpool
