#ifndef STEALTHPOOL_BASICS_BASE_UINT_H_INCLUDED
#define STEALTHPOOL_BASICS_BASE_UINT_H_INCLUDED

#include <libstealthpool/basics/strHex.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <stdexcept>
#include <string>

namespace stealthpool {

/** Fixed width unsigned integer stored big-endian.

    The byte order matches how chain words are hashed and packed, so
    data()[0] is the most significant byte.
*/
template <std::size_t Bits>
class base_uint
{
    static_assert(Bits % 8 == 0, "base_uint must be a whole number of bytes");

public:
    static constexpr std::size_t bytes = Bits / 8;

    using value_type = std::uint8_t;
    using iterator = typename std::array<std::uint8_t, bytes>::iterator;
    using const_iterator =
        typename std::array<std::uint8_t, bytes>::const_iterator;

    base_uint()
    {
        data_.fill(0);
    }

    explicit base_uint(std::uint64_t v)
    {
        data_.fill(0);
        for (std::size_t i = 0; i < 8 && i < bytes; ++i)
            data_[bytes - 1 - i] = static_cast<std::uint8_t>(v >> (8 * i));
    }

    static base_uint
    fromBytes(std::uint8_t const* p, std::size_t n)
    {
        if (n != bytes)
            throw std::invalid_argument("base_uint: wrong byte length");
        base_uint r;
        std::memcpy(r.data_.data(), p, bytes);
        return r;
    }

    /** Parse a hex string. An optional 0x prefix is accepted. */
    static base_uint
    fromHex(std::string const& hex)
    {
        auto const raw = strUnHex(hex);
        if (!raw || raw->size() != bytes)
            throw std::invalid_argument("base_uint: malformed hex");
        return fromBytes(raw->data(), raw->size());
    }

    std::uint8_t*
    data()
    {
        return data_.data();
    }

    std::uint8_t const*
    data() const
    {
        return data_.data();
    }

    static constexpr std::size_t
    size()
    {
        return bytes;
    }

    iterator
    begin()
    {
        return data_.begin();
    }
    iterator
    end()
    {
        return data_.end();
    }
    const_iterator
    begin() const
    {
        return data_.begin();
    }
    const_iterator
    end() const
    {
        return data_.end();
    }

    bool
    isZero() const
    {
        return std::all_of(
            data_.begin(), data_.end(), [](std::uint8_t b) { return b == 0; });
    }

    explicit operator bool() const
    {
        return !isZero();
    }

    int
    compare(base_uint const& other) const
    {
        return std::memcmp(data_.data(), other.data_.data(), bytes);
    }

    friend bool
    operator==(base_uint const& a, base_uint const& b)
    {
        return a.compare(b) == 0;
    }
    friend bool
    operator!=(base_uint const& a, base_uint const& b)
    {
        return a.compare(b) != 0;
    }
    friend bool
    operator<(base_uint const& a, base_uint const& b)
    {
        return a.compare(b) < 0;
    }
    friend bool
    operator<=(base_uint const& a, base_uint const& b)
    {
        return a.compare(b) <= 0;
    }
    friend bool
    operator>(base_uint const& a, base_uint const& b)
    {
        return a.compare(b) > 0;
    }
    friend bool
    operator>=(base_uint const& a, base_uint const& b)
    {
        return a.compare(b) >= 0;
    }

    friend base_uint
    operator+(base_uint const& a, base_uint const& b)
    {
        base_uint r;
        unsigned carry = 0;
        for (std::size_t i = bytes; i-- > 0;)
        {
            unsigned const s = unsigned(a.data_[i]) + b.data_[i] + carry;
            r.data_[i] = static_cast<std::uint8_t>(s);
            carry = s >> 8;
        }
        return r;
    }

    /** Wrapping subtraction. Callers compare first when it matters. */
    friend base_uint
    operator-(base_uint const& a, base_uint const& b)
    {
        base_uint r;
        int borrow = 0;
        for (std::size_t i = bytes; i-- > 0;)
        {
            int d = int(a.data_[i]) - b.data_[i] - borrow;
            borrow = d < 0 ? 1 : 0;
            r.data_[i] = static_cast<std::uint8_t>(d + (borrow << 8));
        }
        return r;
    }

    friend std::ostream&
    operator<<(std::ostream& os, base_uint const& v)
    {
        return os << strHex(v.begin(), v.end());
    }

private:
    std::array<std::uint8_t, bytes> data_;
};

using uint256 = base_uint<256>;
using uint160 = base_uint<160>;

template <std::size_t Bits>
std::string
to_string(base_uint<Bits> const& v)
{
    return strHex(v.begin(), v.end());
}

}  // namespace stealthpool

#endif
