#include <libstealthpool/zkp/ZkProver.h>

#include <libstealthpool/zkp/MerklePath.h>
#include <libstealthpool/zkp/Note.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_g1.hpp>
#include <libff/algebra/curves/alt_bn128/alt_bn128_g2.hpp>
#include <libff/algebra/curves/alt_bn128/alt_bn128_init.hpp>

#include <gmp.h>

#include <fstream>
#include <stdexcept>

namespace stealthpool {
namespace zkp {

using libff::alt_bn128_Fq;
using libff::alt_bn128_Fq2;
using libff::alt_bn128_G1;
using libff::alt_bn128_G2;

namespace {

template <mp_size_t N>
uint256 limbsToUint(const libff::bigint<N>& b) {
    uint256 out;
    constexpr size_t limbBytes = sizeof(mp_limb_t);
    for (mp_size_t i = 0; i < N; ++i) {
        for (size_t j = 0; j < limbBytes; ++j) {
            size_t const pos = static_cast<size_t>(i) * limbBytes + j;
            auto const byte = static_cast<std::uint8_t>(b.data[i] >> (8 * j));
            if (pos < out.size()) {
                out.data()[out.size() - 1 - pos] = byte;
            } else if (byte != 0) {
                throw std::logic_error("limbsToUint: value wider than 256 bits");
            }
        }
    }
    return out;
}

template <mp_size_t N>
libff::bigint<N> uintToLimbs(const uint256& v) {
    libff::bigint<N> b;
    constexpr size_t limbBytes = sizeof(mp_limb_t);
    for (mp_size_t i = 0; i < N; ++i) {
        b.data[i] = 0;
    }
    for (size_t pos = 0; pos < v.size(); ++pos) {
        size_t const limb = pos / limbBytes;
        if (limb >= static_cast<size_t>(N)) {
            break;
        }
        b.data[limb] |= static_cast<mp_limb_t>(v.data()[v.size() - 1 - pos])
            << (8 * (pos % limbBytes));
    }
    return b;
}

uint256 fqToUint(const alt_bn128_Fq& x) {
    return limbsToUint(x.as_bigint());
}

std::optional<alt_bn128_Fq> fqFromUint(const uint256& v) {
    auto const b = uintToLimbs<alt_bn128_Fq::num_limbs>(v);
    if (mpn_cmp(b.data, alt_bn128_Fq::mod.data, alt_bn128_Fq::num_limbs) >= 0) {
        return std::nullopt;
    }
    return alt_bn128_Fq(b);
}

std::array<uint256, 2> g1ToCalldata(alt_bn128_G1 p) {
    if (p.is_zero()) {
        return {uint256{}, uint256{}};
    }
    p.to_affine_coordinates();
    return {fqToUint(p.X), fqToUint(p.Y)};
}

std::optional<alt_bn128_G1> g1FromCalldata(const std::array<uint256, 2>& xy) {
    if (xy[0].isZero() && xy[1].isZero()) {
        return alt_bn128_G1::zero();
    }
    auto const x = fqFromUint(xy[0]);
    auto const y = fqFromUint(xy[1]);
    if (!x || !y) {
        return std::nullopt;
    }
    alt_bn128_G1 p(*x, *y, alt_bn128_Fq::one());
    if (!p.is_well_formed()) {
        return std::nullopt;
    }
    return p;
}

std::array<std::array<uint256, 2>, 2> g2ToCalldata(alt_bn128_G2 p) {
    if (p.is_zero()) {
        return {{{uint256{}, uint256{}}, {uint256{}, uint256{}}}};
    }
    p.to_affine_coordinates();
    return {{{fqToUint(p.X.c0), fqToUint(p.X.c1)},
             {fqToUint(p.Y.c0), fqToUint(p.Y.c1)}}};
}

std::optional<alt_bn128_G2> g2FromCalldata(const std::array<std::array<uint256, 2>, 2>& b) {
    bool const allZero = b[0][0].isZero() && b[0][1].isZero() &&
        b[1][0].isZero() && b[1][1].isZero();
    if (allZero) {
        return alt_bn128_G2::zero();
    }
    auto const x0 = fqFromUint(b[0][0]);
    auto const x1 = fqFromUint(b[0][1]);
    auto const y0 = fqFromUint(b[1][0]);
    auto const y1 = fqFromUint(b[1][1]);
    if (!x0 || !x1 || !y0 || !y1) {
        return std::nullopt;
    }
    alt_bn128_G2 p(
        alt_bn128_Fq2(*x0, *x1),
        alt_bn128_Fq2(*y0, *y1),
        alt_bn128_Fq2::one());
    if (!p.is_well_formed()) {
        return std::nullopt;
    }
    // G2 has a cofactor; reject points outside the r-torsion.
    if (!(libff::alt_bn128_modulus_r * p).is_zero()) {
        return std::nullopt;
    }
    return p;
}

} // namespace

ZkProver::ZkProver(size_t levels, Journal journal)
    : levels_(levels), j_(std::move(journal)) {
    initCurveParameters();
    circuit_ = std::make_shared<WithdrawCircuit>(levels_);
    circuit_->generateConstraints();
}

ZkProver::~ZkProver() = default;

size_t ZkProver::numConstraints() const {
    return circuit_->getConstraintSystem().num_constraints();
}

bool ZkProver::generateKeys(bool forceRegeneration) {
    if (!forceRegeneration && provingKey_ && verificationKey_) {
        JLOG(j_.debug()) << "keys already exist, skipping generation";
        return true;
    }

    try {
        auto cs = circuit_->getConstraintSystem();
        JLOG(j_.info()) << "Running key generator for " << cs.num_constraints()
                        << " constraints at depth " << levels_;

        auto keypair = libsnark::r1cs_gg_ppzksnark_generator<DefaultCurve>(cs);

        provingKey_ = std::make_shared<ProvingKeyT>(std::move(keypair.pk));
        verificationKey_ = std::make_shared<VerificationKeyT>(std::move(keypair.vk));
        processedKey_ = std::make_shared<
            libsnark::r1cs_gg_ppzksnark_processed_verification_key<DefaultCurve>>(
            libsnark::r1cs_gg_ppzksnark_verifier_process_vk<DefaultCurve>(*verificationKey_));

        JLOG(j_.info()) << "Keys generated";
        return true;
    } catch (const std::exception& e) {
        JLOG(j_.error()) << "Error generating keys: " << e.what();
        return false;
    }
}

bool ZkProver::saveKeys(const std::string& basePath) const {
    if (!provingKey_ || !verificationKey_) {
        JLOG(j_.warn()) << "No keys to save";
        return false;
    }

    std::ofstream pkFile(basePath + "_pk", std::ios::binary | std::ios::trunc);
    std::ofstream vkFile(basePath + "_vk", std::ios::binary | std::ios::trunc);
    if (!pkFile || !vkFile) {
        JLOG(j_.error()) << "Unable to open key files under " << basePath;
        return false;
    }

    pkFile << *provingKey_;
    vkFile << *verificationKey_;
    if (!pkFile || !vkFile) {
        JLOG(j_.error()) << "Failed writing key files under " << basePath;
        return false;
    }

    JLOG(j_.info()) << "Saved keys to " << basePath << "_pk/_vk";
    return true;
}

bool ZkProver::loadKeys(const std::string& basePath) {
    std::ifstream vkFile(basePath + "_vk", std::ios::binary);
    if (!vkFile.good()) {
        JLOG(j_.info()) << "No verification key at " << basePath << "_vk";
        return false;
    }

    auto vk = std::make_shared<VerificationKeyT>();
    vkFile >> *vk;
    if (!vkFile) {
        JLOG(j_.error()) << "Malformed verification key at " << basePath << "_vk";
        return false;
    }
    if (vk->gamma_ABC_g1.domain_size() != 3) {
        JLOG(j_.error()) << "Verification key has "
                         << vk->gamma_ABC_g1.domain_size()
                         << " public inputs, expected 3";
        return false;
    }

    // A verifier only needs the small key; the proving key is optional.
    std::shared_ptr<ProvingKeyT> pk;
    std::ifstream pkFile(basePath + "_pk", std::ios::binary);
    if (pkFile.good()) {
        pk = std::make_shared<ProvingKeyT>();
        pkFile >> *pk;
        if (!pkFile) {
            JLOG(j_.error()) << "Malformed proving key at " << basePath << "_pk";
            return false;
        }
        if (pk->constraint_system.num_constraints() != numConstraints()) {
            JLOG(j_.error()) << "Proving key has " << pk->constraint_system.num_constraints()
                             << " constraints, circuit at depth " << levels_
                             << " has " << numConstraints();
            return false;
        }
    }

    provingKey_ = std::move(pk);
    verificationKey_ = std::move(vk);
    processedKey_ = std::make_shared<
        libsnark::r1cs_gg_ppzksnark_processed_verification_key<DefaultCurve>>(
        libsnark::r1cs_gg_ppzksnark_verifier_process_vk<DefaultCurve>(*verificationKey_));

    JLOG(j_.info()) << "Loaded keys from " << basePath
                    << (provingKey_ ? "" : " (verification only)");
    return true;
}

std::optional<Groth16Proof> ZkProver::createWithdrawalProof(
    const Note& note,
    const MerklePath& path,
    const uint256& extDataHash) const {
    if (!provingKey_) {
        JLOG(j_.warn()) << "Proving key not available";
        return std::nullopt;
    }
    if (!isInField(extDataHash) || !isInField(path.root)) {
        JLOG(j_.warn()) << "Public inputs must be below the field modulus";
        return std::nullopt;
    }

    // A fresh circuit per proof keeps the prover free of shared witness state.
    WithdrawCircuit circuit(levels_);
    circuit.generateConstraints();
    circuit.generateWitness(note, path, extDataHash);

    if (!circuit.isSatisfied()) {
        JLOG(j_.warn()) << "Witness does not satisfy the withdraw circuit";
        return std::nullopt;
    }

    auto proof = libsnark::r1cs_gg_ppzksnark_prover<DefaultCurve>(
        *provingKey_, circuit.getPrimaryInput(), circuit.getAuxiliaryInput());

    JLOG(j_.debug()) << "Withdrawal proof generated for leaf " << path.leafIndex;
    return toCalldata(proof);
}

bool ZkProver::verifyWithdrawalProof(
    const Groth16Proof& calldata,
    const WithdrawPublicInputs& inputs) const {
    if (!processedKey_) {
        JLOG(j_.warn()) << "Verification key not available";
        return false;
    }
    if (!isInField(inputs.root) || !isInField(inputs.nullifierHash) ||
        !isInField(inputs.extDataHash)) {
        return false;
    }

    auto const proof = fromCalldata(calldata);
    if (!proof) {
        JLOG(j_.debug()) << "Proof points are malformed";
        return false;
    }

    libsnark::r1cs_primary_input<FieldT> primaryInput;
    primaryInput.push_back(toField(inputs.root));
    primaryInput.push_back(toField(inputs.nullifierHash));
    primaryInput.push_back(toField(inputs.extDataHash));

    bool const ok = libsnark::r1cs_gg_ppzksnark_online_verifier_strong_IC<DefaultCurve>(
        *processedKey_, primaryInput, *proof);
    JLOG(j_.debug()) << "Withdrawal proof verification: " << (ok ? "valid" : "invalid");
    return ok;
}

Groth16Proof ZkProver::toCalldata(const ProofT& proof) {
    Groth16Proof out;
    out.a = g1ToCalldata(proof.g_A);
    out.b = g2ToCalldata(proof.g_B);
    out.c = g1ToCalldata(proof.g_C);
    return out;
}

std::optional<ZkProver::ProofT> ZkProver::fromCalldata(const Groth16Proof& calldata) {
    initCurveParameters();
    auto a = g1FromCalldata(calldata.a);
    auto b = g2FromCalldata(calldata.b);
    auto c = g1FromCalldata(calldata.c);
    if (!a || !b || !c) {
        return std::nullopt;
    }
    return ProofT(std::move(*a), std::move(*b), std::move(*c));
}

} // namespace zkp
} // namespace stealthpool
