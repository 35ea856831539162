#include <libstealthpool/zkp/MiMC.h>

#include <libstealthpool/crypto/Digest.h>

#include <string>

namespace stealthpool {
namespace zkp {

const std::vector<FieldT>& MiMCSponge::roundConstants() {
    static const std::vector<FieldT> constants = [] {
        initCurveParameters();
        std::vector<FieldT> c(ROUNDS, FieldT::zero());

        std::string const seed = "mimcsponge";
        uint256 h = sha256(
            reinterpret_cast<const std::uint8_t*>(seed.data()), seed.size());
        for (std::size_t i = 1; i + 1 < ROUNDS; ++i) {
            h = sha256(h.data(), h.size());
            c[i] = toField(h);
        }
        return c;
    }();
    return constants;
}

void MiMCSponge::permute(FieldT& xL, FieldT& xR) {
    const auto& c = roundConstants();
    for (std::size_t i = 0; i < ROUNDS; ++i) {
        FieldT const t = xL + c[i];
        FieldT const t2 = t * t;
        FieldT const t5 = t2 * t2 * t;
        if (i + 1 < ROUNDS) {
            FieldT const next = xR + t5;
            xR = xL;
            xL = next;
        } else {
            xR = xR + t5;
        }
    }
}

FieldT MiMCSponge::hash(const std::vector<FieldT>& inputs) {
    FieldT xL = FieldT::zero();
    FieldT xR = FieldT::zero();
    for (const auto& in : inputs) {
        xL = xL + in;
        permute(xL, xR);
    }
    return xL;
}

FieldT MiMCSponge::hash2(const FieldT& left, const FieldT& right) {
    return hash({left, right});
}

uint256 MiMCSponge::hash2(const uint256& left, const uint256& right) {
    return fromField(hash2(toField(left), toField(right)));
}

} // namespace zkp
} // namespace stealthpool
