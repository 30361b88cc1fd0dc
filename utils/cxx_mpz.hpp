#ifndef ZMODN_CXX_MPZ_HPP
#define ZMODN_CXX_MPZ_HPP

#include <cstddef>

#include <compare>
#include <istream>
#include <ostream>
#include <type_traits>

#include <gmp.h>
#include "fmt/format.h"
#include "fmt/ostream.h"

#include "gmp_auxx.hpp"
#include "macros.h"

struct cxx_mpz {
public:
    mpz_t x;
    // NOLINTBEGIN(cppcoreguidelines-pro-type-member-init,hicpp-member-init)

    /* we set to zero because both default-initialization and
     * value-initialization reach here. It makes better sense to take 0
     * for the value-initialized case.
     */
    cxx_mpz() { mpz_init_set_ui(x, 0); }

    template <typename T>
        // NOLINTNEXTLINE(hicpp-explicit-conversions)
        cxx_mpz (const T & rhs)
        requires (gmp_auxx::signed_integral<T> || gmp_auxx::unsigned_integral<T>)
        {
            gmp_auxx::mpz_init_set(x, rhs);
        }
    template <typename T>
        cxx_mpz & operator=(const T a)
        requires (gmp_auxx::signed_integral<T> || gmp_auxx::unsigned_integral<T>)
        {
            gmp_auxx::mpz_set(x, a);
            return *this;
        }

    ~cxx_mpz() { mpz_clear(x); }
    cxx_mpz(cxx_mpz const & o) {
        mpz_init_set(x, o.x);
    }
    // NOLINTNEXTLINE(hicpp-explicit-conversions)
    cxx_mpz(mpz_srcptr a) {
        mpz_init_set(x, a);
    }
    cxx_mpz & operator=(cxx_mpz const & o) {
        if (&o != this)
            mpz_set(x, o.x);
        return *this;
    }
    // NOLINTEND(cppcoreguidelines-pro-type-member-init,hicpp-member-init)

    cxx_mpz(cxx_mpz && o) noexcept
        : cxx_mpz()
    {
        mpz_swap(x, o.x);
    }
    cxx_mpz& operator=(cxx_mpz && o) noexcept {
        if (&o != this)
            mpz_swap(x, o.x);
        return *this;
    }
    // NOLINTBEGIN(hicpp-explicit-conversions)
    operator mpz_ptr() { return x; }
    operator mpz_srcptr() const { return x; }
    /* it is very impotant to have the conversion to bool, otherwise the
     * implicit conversion to mpz_ptr wins!
     */
    explicit operator bool() { return mpz_size(x) != 0; }
    explicit operator bool() const { return mpz_size(x) != 0; }
    // NOLINTEND(hicpp-explicit-conversions)
    mpz_ptr operator->() { return x; }
    mpz_srcptr operator->() const { return x; }

    int sgn() const { return mpz_sgn(x); }
    bool is_odd() const { return mpz_odd_p(x); }
    size_t bits() const { return mpz_sizeinbase(x, 2); }

    template <typename T>
    bool fits() const;
};

template <>
inline bool cxx_mpz::fits<unsigned long>() const {
    return mpz_fits_ulong_p(x);
}

template <>
inline bool cxx_mpz::fits<long>() const {
    return mpz_fits_slong_p(x);
}

template <>
inline bool cxx_mpz::fits<int>() const {
    return mpz_fits_sint_p(x);
}

#if GNUC_VERSION_ATLEAST(4,3,0)
extern void mpz_init(cxx_mpz & pl) __attribute__((error("mpz_init must not be called on a mpz reference -- it is the caller's business (via a ctor)")));
extern void mpz_clear(cxx_mpz & pl) __attribute__((error("mpz_clear must not be called on a mpz reference -- it is the caller's business (via a dtor)")));
#endif

static inline std::strong_ordering operator<=>(cxx_mpz const & a, cxx_mpz const & b)
{
    return gmp_auxx::mpz_cmp(a, b) <=> 0;
}
static inline bool operator==(cxx_mpz const & a, cxx_mpz const & b) {
    return gmp_auxx::mpz_cmp(a, b) == 0;
}

template <typename T>
static inline std::strong_ordering operator<=>(cxx_mpz const & a, T const & b)
    requires std::is_integral_v<T>
{
    return gmp_auxx::mpz_cmp(a, b) <=> 0;
}
template <typename T>
static inline bool operator==(cxx_mpz const & a, T const & b)
    requires std::is_integral_v<T>
{
    return gmp_auxx::mpz_cmp(a, b) == 0;
}

static inline cxx_mpz operator+(cxx_mpz const & a, cxx_mpz const & b) { cxx_mpz r; mpz_add(r, a, b); return r; }
template <typename T>
static inline cxx_mpz operator+(cxx_mpz const & a, const T b)
    requires std::is_integral_v<T>
{ cxx_mpz r; gmp_auxx::mpz_add(r, a, b); return r; }

template <typename T> inline cxx_mpz operator+(const T a, cxx_mpz const & b)
requires std::is_integral_v<T>
 { cxx_mpz r; gmp_auxx::mpz_add(r, b, a); return r; }

static inline cxx_mpz & operator+=(cxx_mpz & a, cxx_mpz const & b) { mpz_add(a, a, b); return a; }
template <typename T> inline cxx_mpz & operator+=(cxx_mpz & a, const T b)
requires std::is_integral_v<T>
 { gmp_auxx::mpz_add(a, a, b); return a; }

static inline cxx_mpz operator-(cxx_mpz const & a) { cxx_mpz r; mpz_neg(r, a); return r; }
static inline cxx_mpz operator-(cxx_mpz const & a, cxx_mpz const & b) { cxx_mpz r; mpz_sub(r, a, b); return r; }
template <typename T> inline cxx_mpz operator-(cxx_mpz const & a, const T b)
requires std::is_integral_v<T>
 { cxx_mpz r; gmp_auxx::mpz_sub(r, a, b); return r; }
template <typename T> inline cxx_mpz operator-(const T a, cxx_mpz const & b)
requires std::is_integral_v<T>
 { cxx_mpz r; gmp_auxx::mpz_sub(r, a, b); return r; }

static inline cxx_mpz & operator-=(cxx_mpz & a, cxx_mpz const & b) { mpz_sub(a, a, b); return a; }
template <typename T> inline cxx_mpz & operator-=(cxx_mpz & a, const T b)
requires std::is_integral_v<T>
 { gmp_auxx::mpz_sub(a, a, b); return a; }

static inline cxx_mpz operator*(cxx_mpz const & a, cxx_mpz const & b) { cxx_mpz r; mpz_mul(r, a, b); return r; }
template <typename T> inline cxx_mpz operator*(cxx_mpz const & a, const T b)
requires std::is_integral_v<T>
 { cxx_mpz r; gmp_auxx::mpz_mul(r, a, b); return r; }
template <typename T> inline cxx_mpz operator*(const T a, cxx_mpz const & b)
requires std::is_integral_v<T>
 { cxx_mpz r; gmp_auxx::mpz_mul(r, b, a); return r; }

static inline cxx_mpz & operator*=(cxx_mpz & a, cxx_mpz const & b) { mpz_mul(a, a, b); return a; }
template <typename T> inline cxx_mpz & operator*=(cxx_mpz & a, const T b)
requires std::is_integral_v<T>
 { gmp_auxx::mpz_mul(a, a, b); return a; }

/* Beware: / and % truncate towards zero, like the C operators on
 * machine integers. Use zmodn::divide() or mpz_fdiv_* when the sign of
 * the remainder matters.
 */
static inline cxx_mpz operator/(cxx_mpz const & a, cxx_mpz const & b) { cxx_mpz r; mpz_tdiv_q(r, a, b); return r; }
template <typename T> inline cxx_mpz operator/(cxx_mpz const & a, const T b)
requires gmp_auxx::unsigned_integral<T>
 { cxx_mpz r; mpz_tdiv_q_ui(r, a, b); return r; }

static inline cxx_mpz & operator/=(cxx_mpz & a, cxx_mpz const & b) { mpz_tdiv_q(a, a, b); return a; }

static inline cxx_mpz operator%(cxx_mpz const & a, cxx_mpz const & b)  { cxx_mpz r; mpz_tdiv_r(r, a, b); return r; }
template <typename T> inline cxx_mpz operator%(cxx_mpz const & a, const T b)
requires gmp_auxx::unsigned_integral<T>
 { cxx_mpz r; mpz_tdiv_r_ui(r, a, b); return r; }

static inline cxx_mpz & operator<<=(cxx_mpz & a, const mp_bitcnt_t s)  { mpz_mul_2exp(a, a, s); return a; }
static inline cxx_mpz operator<<(cxx_mpz const & a, const mp_bitcnt_t s)  { cxx_mpz r{a}; mpz_mul_2exp(r, r, s); return r; }

static inline cxx_mpz & operator>>=(cxx_mpz & a, const mp_bitcnt_t s)  { mpz_tdiv_q_2exp(a, a, s); return a; }
static inline cxx_mpz operator>>(cxx_mpz const & a, const mp_bitcnt_t s)  { cxx_mpz r{a}; mpz_tdiv_q_2exp(r, r, s); return r; }

inline std::ostream& operator<<(std::ostream& os, cxx_mpz const& x) { return os << (mpz_srcptr) x; }
inline std::istream& operator>>(std::istream& is, cxx_mpz & x) { return is >> (mpz_ptr) x; }

namespace fmt {
    template <> struct formatter<cxx_mpz>: ostream_formatter {};
}

/* a shorthand so that we can use user-defined literals */
static inline cxx_mpz operator""_mpz(char const * str, size_t)
{
    cxx_mpz res;
    mpz_set_str(res, str, 0);
    return res;
}

#endif	/* ZMODN_CXX_MPZ_HPP */
