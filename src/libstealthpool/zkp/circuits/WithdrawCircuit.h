#pragma once

#include <libstealthpool/zkp/Field.h>

#include <libsnark/gadgetlib1/protoboard.hpp>
#include <libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp>

#include <memory>
#include <vector>

namespace stealthpool {
namespace zkp {

struct Note;
struct MerklePath;

/**
 * Withdraw Circuit
 * ============================================
 *
 * Proves that the prover knows a deposit note in the pool without saying
 * which one.
 *
 * PUBLIC INPUTS: [root, nullifierHash, extDataHash]
 * PRIVATE INPUTS: [nullifier, secret, pathElements[L], pathIndices[L]]
 *
 * CONSTRAINTS:
 * - commitment = H(nullifier, secret)
 * - nullifierHash = H(nullifier, 0)
 * - folding commitment up the path with pathIndices gives root
 * - every pathIndices[i] is boolean
 * - extDataHash^2 is computed so the input cannot be dropped or changed
 *   without invalidating the proof
 *
 * H is the MiMC sponge, see mimc_hash2_gadget.
 */
class WithdrawCircuit
{
public:
    /**
     * Construct a withdraw circuit.
     * @param levels Depth of the commitment tree.
     */
    explicit WithdrawCircuit(size_t levels);

    ~WithdrawCircuit();

    /** Generate R1CS constraints. Call once before keys or witnesses. */
    void generateConstraints();

    /**
     * Assign every variable for spending the given note.
     *
     * @param note Note being withdrawn
     * @param path Authentication path of note.commitment; path.root becomes
     *             the public root
     * @param extDataHash Binding hash of the withdrawal parameters, already
     *                    reduced mod p
     */
    void generateWitness(
        const Note& note,
        const MerklePath& path,
        const uint256& extDataHash);

    bool isSatisfied() const;

    FieldT getRoot() const;
    FieldT getNullifierHash() const;
    FieldT getExtDataHash() const;

    // Circuit system accessors
    libsnark::r1cs_constraint_system<FieldT> getConstraintSystem() const;
    libsnark::r1cs_primary_input<FieldT> getPrimaryInput() const;
    libsnark::r1cs_auxiliary_input<FieldT> getAuxiliaryInput() const;
    std::shared_ptr<libsnark::protoboard<FieldT>> getProtoboard() const;
    size_t getLevels() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace zkp
} // namespace stealthpool
