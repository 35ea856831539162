#pragma once

#include <libstealthpool/basics/base_uint.h>

#include <array>

namespace stealthpool {
namespace zkp {

/**
 * Groth16 proof as submitted on chain: affine coordinates of
 * A (G1), B (G2) and C (G1), each coordinate a big-endian base field word.
 * b is laid out as [[x.c0, x.c1], [y.c0, y.c1]].
 */
struct Groth16Proof {
    std::array<uint256, 2> a;
    std::array<std::array<uint256, 2>, 2> b;
    std::array<uint256, 2> c;

    friend bool operator==(const Groth16Proof& x, const Groth16Proof& y) {
        return x.a == y.a && x.b == y.b && x.c == y.c;
    }
};

/** Public inputs of the withdraw circuit, in circuit order. */
struct WithdrawPublicInputs {
    uint256 root;
    uint256 nullifierHash;
    uint256 extDataHash;
};

} // namespace zkp
} // namespace stealthpool
