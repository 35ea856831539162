#include <libstealthpool/zkp/Field.h>
#include <libstealthpool/zkp/circuits/MiMCGadget.h>
#include <libstealthpool/zkp/circuits/WithdrawCircuit.h>

#include <test/support/PoolFixtures.h>

#include <boost/test/unit_test.hpp>

#include <stdexcept>

using namespace stealthpool;
using namespace stealthpool::zkp;

namespace {

std::size_t const levels = 3;
uint256 const extDataHash(0xabcdef);

}  // namespace

BOOST_AUTO_TEST_SUITE(WithdrawCircuit_test)

BOOST_AUTO_TEST_CASE(valid_witness)
{
    auto const placed = test::placeNote(levels, 2, 5);

    WithdrawCircuit circuit(levels);
    circuit.generateConstraints();
    circuit.generateWitness(placed.note, placed.path, extDataHash);

    BOOST_CHECK(circuit.isSatisfied());
    BOOST_CHECK(circuit.getRoot() == toField(placed.path.root));
    BOOST_CHECK(circuit.getNullifierHash() == toField(placed.note.nullifierHash));
    BOOST_CHECK(circuit.getExtDataHash() == toField(extDataHash));

    auto const primary = circuit.getPrimaryInput();
    BOOST_REQUIRE_EQUAL(primary.size(), 3u);
    BOOST_CHECK(primary[0] == toField(placed.path.root));
    BOOST_CHECK(primary[1] == toField(placed.note.nullifierHash));
    BOOST_CHECK(primary[2] == toField(extDataHash));
}

BOOST_AUTO_TEST_CASE(constraint_count)
{
    WithdrawCircuit circuit(levels);
    circuit.generateConstraints();
    auto const hashers = (levels + 2) * mimc_hash2_gadget<FieldT>::constraint_count();
    auto const count = circuit.getConstraintSystem().num_constraints();
    BOOST_CHECK_GE(count, hashers);
    BOOST_CHECK_LE(count, hashers + 4 * levels + 4);
}

BOOST_AUTO_TEST_CASE(every_leaf_position)
{
    for (std::uint64_t position = 0; position < 8; ++position)
    {
        auto const placed = test::placeNote(levels, position, 8);
        WithdrawCircuit circuit(levels);
        circuit.generateConstraints();
        circuit.generateWitness(placed.note, placed.path, extDataHash);
        BOOST_CHECK_MESSAGE(circuit.isSatisfied(), "position " << position);
    }
}

BOOST_AUTO_TEST_CASE(wrong_root_is_unsatisfied)
{
    auto placed = test::placeNote(levels, 1, 4);
    placed.path.root = MiMCSponge::hash2(uint256(1), uint256(2));

    WithdrawCircuit circuit(levels);
    circuit.generateConstraints();
    circuit.generateWitness(placed.note, placed.path, extDataHash);
    BOOST_CHECK(!circuit.isSatisfied());
}

BOOST_AUTO_TEST_CASE(wrong_sibling_is_unsatisfied)
{
    auto placed = test::placeNote(levels, 1, 4);
    placed.path.pathElements[1] = uint256(5);

    WithdrawCircuit circuit(levels);
    circuit.generateConstraints();
    circuit.generateWitness(placed.note, placed.path, extDataHash);
    BOOST_CHECK(!circuit.isSatisfied());
}

BOOST_AUTO_TEST_CASE(path_length_must_match)
{
    auto const placed = test::placeNote(levels + 1, 0, 2);
    WithdrawCircuit circuit(levels);
    circuit.generateConstraints();
    BOOST_CHECK_THROW(
        circuit.generateWitness(placed.note, placed.path, extDataHash),
        std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
