#pragma once

#include <libstealthpool/basics/base_uint.h>

#include <cstdint>
#include <optional>
#include <string>

namespace stealthpool {
namespace zkp {

/**
 * Note structure
 * A deposit note holds the two secrets behind a pool commitment:
 * - nullifier: revealed only as nullifierHash = H(nullifier, 0) on withdrawal
 * - secret: blinds the commitment
 * - commitment = H(nullifier, secret), the leaf inserted on deposit
 *
 * Anyone holding the note can withdraw the deposit. Losing it makes the
 * deposit unrecoverable.
 */
struct Note {
    uint256 nullifier;
    uint256 secret;
    uint256 commitment;
    uint256 nullifierHash;
    std::optional<std::uint64_t> leafIndex;

    /**
     * Derive commitment and nullifier hash from the two secrets.
     * @throws std::invalid_argument if either is not below the field modulus
     */
    static Note fromSecrets(const uint256& nullifier, const uint256& secret);

    /**
     * Fresh note from 31 random bytes per secret, so both are below p.
     * @throws RandomnessUnavailable
     */
    static Note random();

    /** True when commitment and nullifierHash match the secrets. */
    bool isValid() const;
};

/**
 * Persisted form of a note together with the pool it belongs to.
 * Field elements and amounts are stored as decimal strings.
 */
struct NoteRecord {
    Note note;
    uint256 denomination;
    uint160 poolAddress;
    std::string createdAt;
};

std::string noteToJson(const NoteRecord& record);

/** @throws std::invalid_argument on malformed or inconsistent input */
NoteRecord noteFromJson(const std::string& json);

void saveNote(const NoteRecord& record, const std::string& path);

NoteRecord loadNote(const std::string& path);

} // namespace zkp
} // namespace stealthpool
