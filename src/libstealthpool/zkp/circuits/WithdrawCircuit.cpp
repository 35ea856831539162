#include <libstealthpool/zkp/circuits/WithdrawCircuit.h>

#include <libstealthpool/zkp/MerklePath.h>
#include <libstealthpool/zkp/Note.h>
#include <libstealthpool/zkp/circuits/MiMCGadget.h>

#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>

#include <stdexcept>

namespace stealthpool {
namespace zkp {

using libsnark::pb_variable;
using libsnark::pb_variable_array;
using libsnark::r1cs_constraint;
using libsnark::linear_combination;

class WithdrawCircuit::Impl {
private:
    size_t levels_;
    std::shared_ptr<libsnark::protoboard<FieldT>> pb_;
    bool constraintsGenerated_ = false;

    // ===== PUBLIC INPUTS (PRIMARY) =====
    pb_variable<FieldT> root_;
    pb_variable<FieldT> nullifierHash_;
    pb_variable<FieldT> extDataHash_;

    // ===== PRIVATE INPUTS (AUXILIARY) =====
    pb_variable<FieldT> nullifier_;
    pb_variable<FieldT> secret_;
    pb_variable_array<FieldT> pathElements_;
    pb_variable_array<FieldT> pathIndices_;

    // ===== INTERMEDIATES =====
    pb_variable<FieldT> zero_;
    pb_variable<FieldT> commitment_;
    pb_variable<FieldT> extDataSquare_;
    pb_variable_array<FieldT> left_;
    pb_variable_array<FieldT> right_;
    pb_variable_array<FieldT> levelHash_;

    // ===== GADGETS =====
    std::unique_ptr<mimc_hash2_gadget<FieldT>> commitmentHasher_;
    std::unique_ptr<mimc_hash2_gadget<FieldT>> nullifierHasher_;
    std::vector<std::unique_ptr<mimc_hash2_gadget<FieldT>>> levelHashers_;

    pb_variable<FieldT> current(size_t level) const {
        return level == 0 ? commitment_ : levelHash_[level - 1];
    }

public:
    explicit Impl(size_t levels) : levels_(levels) {
        if (levels == 0 || levels > 32) {
            throw std::invalid_argument("WithdrawCircuit: levels must be in [1, 32]");
        }
        initCurveParameters();

        pb_ = std::make_shared<libsnark::protoboard<FieldT>>();

        // Allocate public inputs first (order: root, nullifierHash, extDataHash)
        root_.allocate(*pb_, "root");
        nullifierHash_.allocate(*pb_, "nullifier_hash");
        extDataHash_.allocate(*pb_, "ext_data_hash");

        pb_->set_input_sizes(3);

        nullifier_.allocate(*pb_, "nullifier");
        secret_.allocate(*pb_, "secret");
        pathElements_.allocate(*pb_, levels_, "path_elements");
        pathIndices_.allocate(*pb_, levels_, "path_indices");

        zero_.allocate(*pb_, "zero");
        commitment_.allocate(*pb_, "commitment");
        extDataSquare_.allocate(*pb_, "ext_data_square");
        left_.allocate(*pb_, levels_, "left");
        right_.allocate(*pb_, levels_, "right");
        levelHash_.allocate(*pb_, levels_, "level_hash");

        commitmentHasher_ = std::make_unique<mimc_hash2_gadget<FieldT>>(
            *pb_, nullifier_, secret_, commitment_, "commitment_hasher");
        nullifierHasher_ = std::make_unique<mimc_hash2_gadget<FieldT>>(
            *pb_, nullifier_, zero_, nullifierHash_, "nullifier_hasher");

        levelHashers_.reserve(levels_);
        for (size_t i = 0; i < levels_; ++i) {
            levelHashers_.push_back(std::make_unique<mimc_hash2_gadget<FieldT>>(
                *pb_, left_[i], right_[i], levelHash_[i],
                "level_hasher_" + std::to_string(i)));
        }
    }

    void generateConstraints() {
        if (constraintsGenerated_) {
            return;
        }

        // zero is pinned so H(nullifier, 0) cannot be steered.
        pb_->add_r1cs_constraint(
            r1cs_constraint<FieldT>(zero_, 1, 0), "zero_is_zero");

        commitmentHasher_->generate_r1cs_constraints();
        nullifierHasher_->generate_r1cs_constraints();

        for (size_t i = 0; i < levels_; ++i) {
            pb_variable<FieldT> const cur = current(i);

            libsnark::generate_boolean_r1cs_constraint<FieldT>(
                *pb_, pathIndices_[i], "path_index_boolean_" + std::to_string(i));

            // left = cur + b * (sibling - cur)
            pb_->add_r1cs_constraint(
                r1cs_constraint<FieldT>(
                    pathElements_[i] - cur,
                    pathIndices_[i],
                    left_[i] - cur),
                "select_left_" + std::to_string(i));

            // right = cur + sibling - left
            pb_->add_r1cs_constraint(
                r1cs_constraint<FieldT>(
                    1,
                    linear_combination<FieldT>(cur) + pathElements_[i] - left_[i],
                    right_[i]),
                "select_right_" + std::to_string(i));

            levelHashers_[i]->generate_r1cs_constraints();
        }

        pb_->add_r1cs_constraint(
            r1cs_constraint<FieldT>(1, levelHash_[levels_ - 1], root_),
            "root_matches");

        pb_->add_r1cs_constraint(
            r1cs_constraint<FieldT>(extDataHash_, extDataHash_, extDataSquare_),
            "ext_data_square");

        constraintsGenerated_ = true;
    }

    void generateWitness(
        const Note& note,
        const MerklePath& path,
        const uint256& extDataHash) {
        if (path.pathElements.size() != levels_ || path.pathIndices.size() != levels_) {
            throw std::invalid_argument("WithdrawCircuit: path length does not match levels");
        }

        pb_->val(root_) = toField(path.root);
        pb_->val(extDataHash_) = toField(extDataHash);
        pb_->val(extDataSquare_) = pb_->val(extDataHash_) * pb_->val(extDataHash_);

        pb_->val(nullifier_) = toField(note.nullifier);
        pb_->val(secret_) = toField(note.secret);
        pb_->val(zero_) = FieldT::zero();

        commitmentHasher_->generate_r1cs_witness();
        nullifierHasher_->generate_r1cs_witness();

        for (size_t i = 0; i < levels_; ++i) {
            FieldT const cur = pb_->val(current(i));
            FieldT const sibling = toField(path.pathElements[i]);
            bool const isRight = path.pathIndices[i];

            pb_->val(pathElements_[i]) = sibling;
            pb_->val(pathIndices_[i]) = isRight ? FieldT::one() : FieldT::zero();
            pb_->val(left_[i]) = isRight ? sibling : cur;
            pb_->val(right_[i]) = isRight ? cur : sibling;

            levelHashers_[i]->generate_r1cs_witness();
        }
    }

    bool isSatisfied() const { return pb_->is_satisfied(); }

    FieldT getRoot() const { return pb_->val(root_); }
    FieldT getNullifierHash() const { return pb_->val(nullifierHash_); }
    FieldT getExtDataHash() const { return pb_->val(extDataHash_); }

    libsnark::r1cs_constraint_system<FieldT> getConstraintSystem() const {
        return pb_->get_constraint_system();
    }
    libsnark::r1cs_primary_input<FieldT> getPrimaryInput() const {
        return pb_->primary_input();
    }
    libsnark::r1cs_auxiliary_input<FieldT> getAuxiliaryInput() const {
        return pb_->auxiliary_input();
    }
    std::shared_ptr<libsnark::protoboard<FieldT>> getProtoboard() const { return pb_; }
    size_t getLevels() const { return levels_; }
};

WithdrawCircuit::WithdrawCircuit(size_t levels)
    : pImpl_(std::make_unique<Impl>(levels)) {}

WithdrawCircuit::~WithdrawCircuit() = default;

void WithdrawCircuit::generateConstraints() {
    pImpl_->generateConstraints();
}

void WithdrawCircuit::generateWitness(
    const Note& note,
    const MerklePath& path,
    const uint256& extDataHash) {
    pImpl_->generateWitness(note, path, extDataHash);
}

bool WithdrawCircuit::isSatisfied() const {
    return pImpl_->isSatisfied();
}

FieldT WithdrawCircuit::getRoot() const {
    return pImpl_->getRoot();
}

FieldT WithdrawCircuit::getNullifierHash() const {
    return pImpl_->getNullifierHash();
}

FieldT WithdrawCircuit::getExtDataHash() const {
    return pImpl_->getExtDataHash();
}

libsnark::r1cs_constraint_system<FieldT> WithdrawCircuit::getConstraintSystem() const {
    return pImpl_->getConstraintSystem();
}

libsnark::r1cs_primary_input<FieldT> WithdrawCircuit::getPrimaryInput() const {
    return pImpl_->getPrimaryInput();
}

libsnark::r1cs_auxiliary_input<FieldT> WithdrawCircuit::getAuxiliaryInput() const {
    return pImpl_->getAuxiliaryInput();
}

std::shared_ptr<libsnark::protoboard<FieldT>> WithdrawCircuit::getProtoboard() const {
    return pImpl_->getProtoboard();
}

size_t WithdrawCircuit::getLevels() const {
    return pImpl_->getLevels();
}

} // namespace zkp
} // namespace stealthpool
