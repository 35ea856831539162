#ifndef STEALTHPOOL_ZKP_MIMC_GADGET_H_INCLUDED
#define STEALTHPOOL_ZKP_MIMC_GADGET_H_INCLUDED

#include <libstealthpool/zkp/MiMC.h>

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>

#include <string>
#include <vector>

namespace stealthpool {
namespace zkp {

/**
 * In-circuit MiMCSponge::hash2.
 *
 * Each round costs three constraints: t^2, t^4 and t^4 * t = out - xR, where
 * t = xL + c_i is a linear combination. Absorbing an input into xL is linear
 * and needs no constraint. The final constraint copies xL into `result`.
 */
template <typename FieldT>
class mimc_hash2_gadget : public libsnark::gadget<FieldT>
{
private:
    static constexpr std::size_t ROUNDS = MiMCSponge::ROUNDS;

    libsnark::pb_variable<FieldT> left;
    libsnark::pb_variable<FieldT> right;
    libsnark::pb_variable<FieldT> result;

    // Per round intermediates, two permutations back to back.
    libsnark::pb_variable_array<FieldT> t2;
    libsnark::pb_variable_array<FieldT> t4;
    libsnark::pb_variable_array<FieldT> out;

    libsnark::linear_combination<FieldT> outputLc;

public:
    mimc_hash2_gadget(
        libsnark::protoboard<FieldT>& pb,
        const libsnark::pb_variable<FieldT>& left,
        const libsnark::pb_variable<FieldT>& right,
        const libsnark::pb_variable<FieldT>& result,
        const std::string& annotation_prefix)
        : libsnark::gadget<FieldT>(pb, annotation_prefix)
        , left(left)
        , right(right)
        , result(result)
    {
        t2.allocate(pb, 2 * ROUNDS, annotation_prefix + "_t2");
        t4.allocate(pb, 2 * ROUNDS, annotation_prefix + "_t4");
        out.allocate(pb, 2 * ROUNDS, annotation_prefix + "_out");
    }

    void
    generate_r1cs_constraints()
    {
        const auto& c = MiMCSponge::roundConstants();

        libsnark::linear_combination<FieldT> xL(left);
        libsnark::linear_combination<FieldT> xR(FieldT::zero());

        for (std::size_t p = 0; p < 2; ++p)
        {
            if (p == 1)
                xL = xL + right;

            for (std::size_t i = 0; i < ROUNDS; ++i)
            {
                std::size_t const k = p * ROUNDS + i;
                libsnark::linear_combination<FieldT> t = xL + c[i];

                this->pb.add_r1cs_constraint(
                    libsnark::r1cs_constraint<FieldT>(t, t, t2[k]),
                    FMT(this->annotation_prefix, "_t2_%zu", k));
                this->pb.add_r1cs_constraint(
                    libsnark::r1cs_constraint<FieldT>(t2[k], t2[k], t4[k]),
                    FMT(this->annotation_prefix, "_t4_%zu", k));
                this->pb.add_r1cs_constraint(
                    libsnark::r1cs_constraint<FieldT>(
                        t4[k],
                        t,
                        libsnark::linear_combination<FieldT>(out[k]) - xR),
                    FMT(this->annotation_prefix, "_t5_%zu", k));

                if (i + 1 < ROUNDS)
                {
                    xR = xL;
                    xL = libsnark::linear_combination<FieldT>(out[k]);
                }
                else
                {
                    xR = libsnark::linear_combination<FieldT>(out[k]);
                }
            }
        }

        outputLc = xL;
        this->pb.add_r1cs_constraint(
            libsnark::r1cs_constraint<FieldT>(1, outputLc, result),
            FMT(this->annotation_prefix, "_result"));
    }

    /** Fills intermediates and result from the values of left and right. */
    void
    generate_r1cs_witness()
    {
        const auto& c = MiMCSponge::roundConstants();

        FieldT xL = this->pb.val(left);
        FieldT xR = FieldT::zero();

        for (std::size_t p = 0; p < 2; ++p)
        {
            if (p == 1)
                xL = xL + this->pb.val(right);

            for (std::size_t i = 0; i < ROUNDS; ++i)
            {
                std::size_t const k = p * ROUNDS + i;
                FieldT const t = xL + c[i];
                FieldT const sq = t * t;
                FieldT const quad = sq * sq;
                FieldT const next = xR + quad * t;

                this->pb.val(t2[k]) = sq;
                this->pb.val(t4[k]) = quad;
                this->pb.val(out[k]) = next;

                if (i + 1 < ROUNDS)
                {
                    xR = xL;
                    xL = next;
                }
                else
                {
                    xR = next;
                }
            }
        }

        this->pb.val(result) = xL;
    }

    static std::size_t
    constraint_count()
    {
        return 2 * ROUNDS * 3 + 1;
    }
};

}  // namespace zkp
}  // namespace stealthpool

#endif
