#include <libstealthpool/zkp/Field.h>
#include <libstealthpool/zkp/MerklePath.h>
#include <libstealthpool/zkp/MerkleTreeWithHistory.h>

#include <boost/test/unit_test.hpp>

#include <set>
#include <stdexcept>
#include <vector>

using namespace stealthpool;
using namespace stealthpool::zkp;

namespace {

uint256
leaf(std::uint64_t i)
{
    return MerkleTreeWithHistory::hashLeftRight(uint256(i), uint256(i + 1));
}

}  // namespace

BOOST_AUTO_TEST_SUITE(MerkleTree_test)

BOOST_AUTO_TEST_CASE(zero_subtrees)
{
    BOOST_CHECK(
        MerkleTreeWithHistory::zeros(0) ==
        MerkleTreeWithHistory::hashLeftRight(uint256(), uint256()));
    for (std::size_t i = 1; i <= 4; ++i)
    {
        auto const& below = MerkleTreeWithHistory::zeros(i - 1);
        BOOST_CHECK(
            MerkleTreeWithHistory::zeros(i) ==
            MerkleTreeWithHistory::hashLeftRight(below, below));
    }

    MerkleTreeWithHistory tree(4);
    BOOST_CHECK(tree.getLastRoot() == MerkleTreeWithHistory::zeros(4));
    BOOST_CHECK(tree.isKnownRoot(MerkleTreeWithHistory::zeros(4)));
    BOOST_CHECK_EQUAL(tree.capacity(), 16u);
}

BOOST_AUTO_TEST_CASE(depth_limits)
{
    BOOST_CHECK_THROW(MerkleTreeWithHistory(0), std::invalid_argument);
    BOOST_CHECK_THROW(MerkleTreeWithHistory(33), std::invalid_argument);
    BOOST_CHECK_EQUAL(MerkleTreeWithHistory(32).levels(), 32u);
    BOOST_CHECK_EQUAL(MerkleTreeWithHistory().levels(), 20u);
}

BOOST_AUTO_TEST_CASE(incremental_root_matches_rebuilt_path)
{
    std::size_t const levels = 4;
    MerkleTreeWithHistory tree(levels);
    std::vector<uint256> leaves;
    std::set<uint256> roots{tree.getLastRoot()};

    for (std::uint64_t i = 0; i < 7; ++i)
    {
        leaves.push_back(leaf(i));
        BOOST_CHECK_EQUAL(tree.insert(leaves.back()), i);
        BOOST_CHECK(roots.insert(tree.getLastRoot()).second);

        for (std::uint64_t j = 0; j <= i; ++j)
        {
            auto const path = buildMerklePath(leaves, j, levels);
            BOOST_CHECK(path.root == tree.getLastRoot());
            BOOST_CHECK_EQUAL(path.pathElements.size(), levels);
            BOOST_CHECK(verifyMerklePath(leaves[j], path));
            BOOST_CHECK(!verifyMerklePath(leaf(100), path));
        }
    }

    auto const path = buildMerklePath(leaves, 5, levels);
    // 5 = 0b0101: right child at levels 0 and 2.
    BOOST_CHECK(path.pathIndices[0]);
    BOOST_CHECK(!path.pathIndices[1]);
    BOOST_CHECK(path.pathIndices[2]);
    BOOST_CHECK(!path.pathIndices[3]);
    BOOST_CHECK(path.pathElements[0] == leaves[4]);
    BOOST_CHECK(path.pathElements[3] == MerkleTreeWithHistory::zeros(3));

    BOOST_REQUIRE(findLeaf(leaves, leaves[3]));
    BOOST_CHECK_EQUAL(*findLeaf(leaves, leaves[3]), 3u);
    BOOST_CHECK(!findLeaf(leaves, leaf(100)));
    BOOST_CHECK_THROW(buildMerklePath(leaves, 7, levels), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(root_history_evicts_oldest)
{
    MerkleTreeWithHistory tree(6);
    tree.insert(leaf(0));
    auto const early = tree.getLastRoot();

    for (std::uint64_t i = 1; i < MerkleTreeWithHistory::ROOT_HISTORY_SIZE; ++i)
    {
        tree.insert(leaf(i));
        BOOST_CHECK(tree.isKnownRoot(early));
    }

    tree.insert(leaf(99));
    BOOST_CHECK(!tree.isKnownRoot(early));
    BOOST_CHECK(tree.isKnownRoot(tree.getLastRoot()));

    auto const history = tree.rootHistory();
    BOOST_CHECK(history.roots[history.currentRootIndex] == tree.getLastRoot());
    BOOST_CHECK(!tree.isKnownRoot(uint256()));
}

BOOST_AUTO_TEST_CASE(tree_full)
{
    MerkleTreeWithHistory tree(2);
    for (std::uint64_t i = 0; i < 4; ++i)
        tree.insert(leaf(i));
    BOOST_CHECK(tree.isFull());

    auto const root = tree.getLastRoot();
    BOOST_CHECK_THROW(tree.insert(leaf(4)), TreeFullError);
    BOOST_CHECK(tree.getLastRoot() == root);
    BOOST_CHECK_EQUAL(tree.nextIndex(), 4u);

    std::vector<uint256> tooMany(5, leaf(0));
    BOOST_CHECK_THROW(buildMerklePath(tooMany, 0, 2), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
