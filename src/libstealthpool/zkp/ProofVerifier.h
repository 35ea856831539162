#pragma once

#include <libstealthpool/zkp/ProofData.h>

namespace stealthpool {
namespace zkp {

/** Checks a withdraw proof against its public inputs. */
class ProofVerifier {
public:
    virtual ~ProofVerifier() = default;

    virtual bool verifyWithdrawalProof(
        const Groth16Proof& proof,
        const WithdrawPublicInputs& inputs) const = 0;
};

} // namespace zkp
} // namespace stealthpool
