#pragma once

#include <libstealthpool/basics/Log.h>
#include <libstealthpool/zkp/Field.h>
#include <libstealthpool/zkp/ProofVerifier.h>
#include <libstealthpool/zkp/circuits/WithdrawCircuit.h>

#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <memory>
#include <optional>
#include <string>

namespace stealthpool {
namespace zkp {

struct Note;
struct MerklePath;

/**
 * Groth16 prover and verifier for the withdraw circuit.
 *
 * Keys belong to one tree depth. They are generated once (see the
 * generate-params tool) and loaded from basePath + "_pk" / basePath + "_vk".
 */
class ZkProver : public ProofVerifier {
public:
    using ProofT = libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>;
    using ProvingKeyT = libsnark::r1cs_gg_ppzksnark_proving_key<DefaultCurve>;
    using VerificationKeyT = libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>;

    ZkProver(size_t levels, Journal journal);
    ~ZkProver() override;

    // Key management
    bool generateKeys(bool forceRegeneration = false);
    bool saveKeys(const std::string& basePath) const;
    bool loadKeys(const std::string& basePath);
    bool hasProvingKey() const { return provingKey_ != nullptr; }
    bool hasVerificationKey() const { return verificationKey_ != nullptr; }

    size_t getLevels() const { return levels_; }
    size_t numConstraints() const;

    /**
     * Prove knowledge of note under path.root, bound to extDataHash.
     * Empty when no proving key is loaded or the witness does not satisfy
     * the circuit (wrong path, stale root).
     */
    std::optional<Groth16Proof> createWithdrawalProof(
        const Note& note,
        const MerklePath& path,
        const uint256& extDataHash) const;

    bool verifyWithdrawalProof(
        const Groth16Proof& proof,
        const WithdrawPublicInputs& inputs) const override;

    /** Affine coordinates of a libsnark proof. */
    static Groth16Proof toCalldata(const ProofT& proof);

    /**
     * Rebuild a libsnark proof from calldata.
     * Empty when a coordinate is not below the base field modulus or a
     * point is not on the curve (or, for B, not in the prime order subgroup).
     */
    static std::optional<ProofT> fromCalldata(const Groth16Proof& calldata);

private:
    size_t levels_;
    Journal j_;
    std::shared_ptr<WithdrawCircuit> circuit_;
    std::shared_ptr<ProvingKeyT> provingKey_;
    std::shared_ptr<VerificationKeyT> verificationKey_;
    std::shared_ptr<libsnark::r1cs_gg_ppzksnark_processed_verification_key<DefaultCurve>> processedKey_;
};

} // namespace zkp
} // namespace stealthpool
