#include <libstealthpool/zkp/Field.h>
#include <libstealthpool/zkp/MerkleTreeWithHistory.h>
#include <libstealthpool/zkp/ZkProver.h>

#include <test/support/PoolFixtures.h>

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

#include <memory>
#include <utility>

using namespace stealthpool;
using namespace stealthpool::zkp;

namespace {

std::size_t const levels = 3;

// Key generation dominates; do it once for the whole suite.
struct ProverFixture
{
    static ZkProver&
    prover()
    {
        static std::unique_ptr<ZkProver> const instance = [] {
            auto p = std::make_unique<ZkProver>(levels, Journal("ZkProver_test"));
            BOOST_REQUIRE(p->generateKeys());
            return p;
        }();
        return *instance;
    }
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(ZkProver_test, ProverFixture)

BOOST_AUTO_TEST_CASE(prove_and_verify)
{
    auto const placed = test::placeNote(levels, 3, 6);
    uint256 const extDataHash(0x1234);

    auto const proof = prover().createWithdrawalProof(
        placed.note, placed.path, extDataHash);
    BOOST_REQUIRE(proof);

    WithdrawPublicInputs inputs{
        placed.path.root, placed.note.nullifierHash, extDataHash};
    BOOST_CHECK(prover().verifyWithdrawalProof(*proof, inputs));

    auto wrongExt = inputs;
    wrongExt.extDataHash = uint256(0x1235);
    BOOST_CHECK(!prover().verifyWithdrawalProof(*proof, wrongExt));

    auto wrongNullifier = inputs;
    wrongNullifier.nullifierHash = MiMCSponge::hash2(uint256(1), uint256());
    BOOST_CHECK(!prover().verifyWithdrawalProof(*proof, wrongNullifier));

    auto wrongRoot = inputs;
    wrongRoot.root = MerkleTreeWithHistory::zeros(levels);
    BOOST_CHECK(!prover().verifyWithdrawalProof(*proof, wrongRoot));

    // Out of field inputs never verify.
    auto outOfField = inputs;
    outOfField.extDataHash = fieldModulus();
    BOOST_CHECK(!prover().verifyWithdrawalProof(*proof, outOfField));
}

BOOST_AUTO_TEST_CASE(no_proof_for_bad_witness)
{
    auto placed = test::placeNote(levels, 0, 2);
    placed.path.root = MiMCSponge::hash2(uint256(9), uint256(9));
    BOOST_CHECK(
        !prover().createWithdrawalProof(placed.note, placed.path, uint256(1)));
}

BOOST_AUTO_TEST_CASE(calldata)
{
    auto const placed = test::placeNote(levels, 1, 2);
    uint256 const extDataHash(77);
    auto const proof =
        prover().createWithdrawalProof(placed.note, placed.path, extDataHash);
    BOOST_REQUIRE(proof);

    auto const rebuilt = ZkProver::fromCalldata(*proof);
    BOOST_REQUIRE(rebuilt);
    BOOST_CHECK(ZkProver::toCalldata(*rebuilt) == *proof);

    // A point moved off the curve is rejected before pairing.
    auto tampered = *proof;
    tampered.a[1] = tampered.a[1] + uint256(1);
    BOOST_CHECK(!ZkProver::fromCalldata(tampered));
    WithdrawPublicInputs inputs{
        placed.path.root, placed.note.nullifierHash, extDataHash};
    BOOST_CHECK(!prover().verifyWithdrawalProof(tampered, inputs));

    // Swapping A and C keeps both on the curve but breaks the pairing.
    auto swapped = *proof;
    std::swap(swapped.a, swapped.c);
    BOOST_CHECK(!prover().verifyWithdrawalProof(swapped, inputs));
}

BOOST_AUTO_TEST_CASE(keys_survive_save_and_load)
{
    auto const dir = boost::filesystem::temp_directory_path() /
        boost::filesystem::unique_path("stealthpool-keys-%%%%%%");
    boost::filesystem::create_directories(dir);
    auto const base = (dir / "withdraw").string();

    BOOST_REQUIRE(prover().saveKeys(base));

    // A proving key for another depth is refused.
    ZkProver deeper(levels + 1, Journal("ZkProver_test"));
    BOOST_CHECK(!deeper.loadKeys(base));

    ZkProver verifierOnly(levels, Journal("ZkProver_test"));
    boost::filesystem::remove(base + "_pk");
    BOOST_REQUIRE(verifierOnly.loadKeys(base));
    BOOST_CHECK(verifierOnly.hasVerificationKey());
    BOOST_CHECK(!verifierOnly.hasProvingKey());

    auto const placed = test::placeNote(levels, 0, 1);
    auto const proof =
        prover().createWithdrawalProof(placed.note, placed.path, uint256(5));
    BOOST_REQUIRE(proof);
    BOOST_CHECK(verifierOnly.verifyWithdrawalProof(
        *proof, {placed.path.root, placed.note.nullifierHash, uint256(5)}));

    boost::filesystem::remove_all(dir);
    BOOST_CHECK(!ZkProver(levels, Journal("ZkProver_test")).loadKeys(base));
}

BOOST_AUTO_TEST_SUITE_END()
