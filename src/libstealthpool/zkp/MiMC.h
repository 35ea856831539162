#pragma once

#include <libstealthpool/zkp/Field.h>

#include <cstddef>
#include <vector>

namespace stealthpool {
namespace zkp {

/**
 * MiMC sponge over the alt_bn128 scalar field.
 *
 * Feistel permutation with exponent 5 and 220 rounds, key fixed to zero.
 * The first and last round constants are zero; the others are derived from
 * a SHA-256 chain seeded with "mimcsponge" and reduced mod p. In the last
 * round the state halves are not swapped.
 *
 * The sponge has one rate lane (xL) and one capacity lane (xR). Inputs are
 * added to xL and followed by one permutation each; the output is xL.
 *
 * This is the H used for commitments, nullifier hashes and tree nodes, and
 * it must agree with mimc_hash2_gadget.
 */
class MiMCSponge {
public:
    static constexpr std::size_t ROUNDS = 220;

    static const std::vector<FieldT>& roundConstants();

    /** One application of the Feistel permutation. */
    static void permute(FieldT& xL, FieldT& xR);

    static FieldT hash(const std::vector<FieldT>& inputs);

    static FieldT hash2(const FieldT& left, const FieldT& right);

    /** hash2 on canonical big-endian words. Inputs are reduced mod p. */
    static uint256 hash2(const uint256& left, const uint256& right);
};

} // namespace zkp
} // namespace stealthpool
