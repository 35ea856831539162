#include <libstealthpool/zkp/MerkleTreeWithHistory.h>

#include <libstealthpool/zkp/MiMC.h>

namespace stealthpool {
namespace zkp {

MerkleTreeWithHistory::MerkleTreeWithHistory(std::size_t levels)
    : levels_(levels) {
    if (levels == 0 || levels > MAX_LEVELS) {
        throw std::invalid_argument("Tree levels must be in [1, 32]");
    }

    for (std::size_t i = 0; i < MAX_LEVELS; ++i) {
        filledSubtrees_[i] = zeros(i);
    }
    roots_.fill(uint256{});
    roots_[0] = zeros(levels_);
}

uint256 MerkleTreeWithHistory::hashLeftRight(const uint256& left, const uint256& right) {
    return MiMCSponge::hash2(left, right);
}

const uint256& MerkleTreeWithHistory::zeros(std::size_t i) {
    static const std::array<uint256, MAX_LEVELS + 1> table = [] {
        std::array<uint256, MAX_LEVELS + 1> z;
        z[0] = hashLeftRight(uint256{}, uint256{});
        for (std::size_t level = 1; level <= MAX_LEVELS; ++level) {
            z[level] = hashLeftRight(z[level - 1], z[level - 1]);
        }
        return z;
    }();
    if (i > MAX_LEVELS) {
        throw std::out_of_range("zeros: level out of range");
    }
    return table[i];
}

std::uint64_t MerkleTreeWithHistory::insert(const uint256& leaf) {
    if (isFull()) {
        throw TreeFullError();
    }

    std::uint64_t const index = nextIndex_;
    std::uint64_t currentIndex = index;
    uint256 currentLevelHash = leaf;

    for (std::size_t level = 0; level < levels_; ++level) {
        uint256 left;
        uint256 right;
        if (currentIndex % 2 == 0) {
            left = currentLevelHash;
            right = zeros(level);
            filledSubtrees_[level] = currentLevelHash;
        } else {
            left = filledSubtrees_[level];
            right = currentLevelHash;
        }
        currentLevelHash = hashLeftRight(left, right);
        currentIndex /= 2;
    }

    currentRootIndex_ = (currentRootIndex_ + 1) % ROOT_HISTORY_SIZE;
    roots_[currentRootIndex_] = currentLevelHash;
    nextIndex_ = index + 1;
    return index;
}

bool MerkleTreeWithHistory::isKnownRoot(const uint256& root) const {
    if (root.isZero()) {
        return false;
    }

    std::uint32_t i = currentRootIndex_;
    do {
        if (roots_[i] == root) {
            return true;
        }
        if (i == 0) {
            i = ROOT_HISTORY_SIZE;
        }
        --i;
    } while (i != currentRootIndex_);

    return false;
}

} // namespace zkp
} // namespace stealthpool
