#include <libstealthpool/zkp/Field.h>

#include <libff/common/profiling.hpp>

#include <gmp.h>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace stealthpool {
namespace zkp {

namespace {

// RAII holder for an mpz_t.
struct Mpz {
    mpz_t v;
    Mpz() { mpz_init(v); }
    ~Mpz() { mpz_clear(v); }
    Mpz(Mpz const&) = delete;
    Mpz& operator=(Mpz const&) = delete;
};

void importBigEndian(mpz_t out, uint256 const& in) {
    mpz_import(out, in.size(), 1, 1, 1, 0, in.data());
}

uint256 exportBigEndian(mpz_t const in) {
    uint256 out;
    std::size_t count = 0;
    std::uint8_t buf[64] = {};
    mpz_export(buf, &count, 1, 1, 1, 0, in);
    if (count > out.size())
        throw std::logic_error("exportBigEndian: value wider than 256 bits");
    std::copy(buf, buf + count, out.data() + (out.size() - count));
    return out;
}

} // namespace

void initCurveParameters() {
    static std::once_flag once;
    std::call_once(once, [] {
        DefaultCurve::init_public_params();
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
    });
}

uint256 const& fieldModulus() {
    static uint256 const p = uint256::fromHex(
        "30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001");
    return p;
}

bool isInField(uint256 const& v) {
    return v < fieldModulus();
}

uint256 reduceToField(uint256 const& v) {
    if (isInField(v))
        return v;
    Mpz x, p;
    importBigEndian(x.v, v);
    importBigEndian(p.v, fieldModulus());
    mpz_mod(x.v, x.v, p.v);
    return exportBigEndian(x.v);
}

FieldT toField(uint256 const& v) {
    initCurveParameters();
    Mpz x;
    importBigEndian(x.v, reduceToField(v));
    return FieldT(libff::bigint<FieldT::num_limbs>(x.v));
}

uint256 fromField(FieldT const& f) {
    initCurveParameters();
    Mpz x;
    f.as_bigint().to_mpz(x.v);
    return exportBigEndian(x.v);
}

std::string toDecimal(FieldT const& f) {
    initCurveParameters();
    Mpz x;
    f.as_bigint().to_mpz(x.v);
    std::unique_ptr<char, void (*)(void*)> s(
        mpz_get_str(nullptr, 10, x.v), std::free);
    return std::string(s.get());
}

FieldT fromDecimal(std::string const& s) {
    initCurveParameters();
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument("not a decimal field element");
    Mpz x, p;
    if (mpz_set_str(x.v, s.c_str(), 10) != 0)
        throw std::invalid_argument("not a decimal field element");
    importBigEndian(p.v, fieldModulus());
    if (mpz_cmp(x.v, p.v) >= 0)
        throw std::invalid_argument("decimal value is not below the field modulus");
    return FieldT(libff::bigint<FieldT::num_limbs>(x.v));
}

std::string uintToDecimal(uint256 const& v) {
    Mpz x;
    importBigEndian(x.v, v);
    std::unique_ptr<char, void (*)(void*)> s(
        mpz_get_str(nullptr, 10, x.v), std::free);
    return std::string(s.get());
}

uint256 uintFromDecimal(std::string const& s) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument("not a decimal integer");
    Mpz x;
    if (mpz_set_str(x.v, s.c_str(), 10) != 0)
        throw std::invalid_argument("not a decimal integer");
    if (mpz_sizeinbase(x.v, 2) > 256)
        throw std::invalid_argument("decimal value wider than 256 bits");
    return exportBigEndian(x.v);
}

} // namespace zkp
} // namespace stealthpool
