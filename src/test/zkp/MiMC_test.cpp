#include <libstealthpool/zkp/Field.h>
#include <libstealthpool/zkp/MiMC.h>
#include <libstealthpool/zkp/circuits/MiMCGadget.h>

#include <libsnark/gadgetlib1/protoboard.hpp>

#include <boost/test/unit_test.hpp>

using namespace stealthpool;
using namespace stealthpool::zkp;

BOOST_AUTO_TEST_SUITE(MiMC_test)

BOOST_AUTO_TEST_CASE(round_constants)
{
    auto const& c = MiMCSponge::roundConstants();
    BOOST_REQUIRE_EQUAL(c.size(), MiMCSponge::ROUNDS);
    BOOST_CHECK(c.front() == FieldT::zero());
    BOOST_CHECK(c.back() == FieldT::zero());
    BOOST_CHECK(c[1] != FieldT::zero());
    BOOST_CHECK(c[1] != c[2]);
}

BOOST_AUTO_TEST_CASE(hash_properties)
{
    initCurveParameters();
    FieldT const a("12345");
    FieldT const b("67890");

    BOOST_CHECK(MiMCSponge::hash2(a, b) == MiMCSponge::hash2(a, b));
    BOOST_CHECK(MiMCSponge::hash2(a, b) != MiMCSponge::hash2(b, a));
    BOOST_CHECK(MiMCSponge::hash2(a, b) == MiMCSponge::hash({a, b}));
    BOOST_CHECK(MiMCSponge::hash({a}) != MiMCSponge::hash2(a, FieldT::zero()));

    auto const words = MiMCSponge::hash2(uint256(12345), uint256(67890));
    BOOST_CHECK(words == fromField(MiMCSponge::hash2(a, b)));
    BOOST_CHECK(isInField(words));
}

BOOST_AUTO_TEST_CASE(gadget_matches_native)
{
    initCurveParameters();
    libsnark::protoboard<FieldT> pb;
    libsnark::pb_variable<FieldT> left;
    libsnark::pb_variable<FieldT> right;
    libsnark::pb_variable<FieldT> result;
    result.allocate(pb, "result");
    left.allocate(pb, "left");
    right.allocate(pb, "right");
    pb.set_input_sizes(1);

    mimc_hash2_gadget<FieldT> hasher(pb, left, right, result, "mimc");
    hasher.generate_r1cs_constraints();
    BOOST_CHECK_EQUAL(
        pb.num_constraints(), mimc_hash2_gadget<FieldT>::constraint_count());

    FieldT const l = FieldT::random_element();
    FieldT const r = FieldT::random_element();
    pb.val(left) = l;
    pb.val(right) = r;
    hasher.generate_r1cs_witness();

    BOOST_CHECK(pb.val(result) == MiMCSponge::hash2(l, r));
    BOOST_CHECK(pb.is_satisfied());

    pb.val(result) = pb.val(result) + FieldT::one();
    BOOST_CHECK(!pb.is_satisfied());
}

BOOST_AUTO_TEST_SUITE_END()
