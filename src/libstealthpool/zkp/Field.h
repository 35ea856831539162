#pragma once

#include <libstealthpool/basics/base_uint.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

#include <string>

namespace stealthpool {
namespace zkp {

using DefaultCurve = libff::alt_bn128_pp;
using FieldT = libff::Fr<DefaultCurve>;

/**
 * Initialize alt_bn128 parameters.
 * Must run before any FieldT arithmetic. Thread-safe and idempotent.
 */
void initCurveParameters();

/** The scalar field modulus p of alt_bn128 (the SNARK scalar field). */
uint256 const& fieldModulus();

/** True when v < p, i.e. v is a canonical public input. */
bool isInField(uint256 const& v);

/** v mod p. */
uint256 reduceToField(uint256 const& v);

/** Interpret big-endian bytes as an integer and reduce mod p. */
FieldT toField(uint256 const& v);

/** Canonical big-endian encoding of a field element. */
uint256 fromField(FieldT const& f);

/** Decimal rendering used in persisted notes and calldata. */
std::string toDecimal(FieldT const& f);

/** Parse a decimal string. Throws std::invalid_argument when not below p. */
FieldT fromDecimal(std::string const& s);

/** Full 256-bit decimal conversions for token amounts. */
std::string uintToDecimal(uint256 const& v);

/** @throws std::invalid_argument when malformed or wider than 256 bits */
uint256 uintFromDecimal(std::string const& s);

} // namespace zkp
} // namespace stealthpool
