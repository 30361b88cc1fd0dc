#ifndef ZMODN_GMP_AUXX_HPP
#define ZMODN_GMP_AUXX_HPP

#include <type_traits>

#include <gmp.h>

/* Overloads of a few mpz functions which dispatch to the _si or _ui
 * variants depending on the signedness of the integral argument. zmodn.h
 * checks that long is wide enough for any 64-bit integer. We keep them
 * out of global name space to avoid obscuring errors */

namespace gmp_auxx {

template<typename T>
concept signed_integral = std::is_integral_v<T> && std::is_signed_v<T>;

template<typename T>
concept unsigned_integral = std::is_integral_v<T> && std::is_unsigned_v<T>
                            && !std::is_same_v<T, bool>;

static inline void mpz_set (mpz_ptr a, mpz_srcptr b) { ::mpz_set(a, b); }

template<signed_integral T>
static inline void mpz_set (mpz_ptr a, const T b) { mpz_set_si(a, b); }

template<unsigned_integral T>
static inline void mpz_set (mpz_ptr a, const T b) { mpz_set_ui(a, b); }

static inline void mpz_init_set (mpz_ptr a, mpz_srcptr b) { ::mpz_init_set(a, b); }

template<signed_integral T>
static inline void mpz_init_set (mpz_ptr a, const T b) { mpz_init_set_si(a, b); }

template<unsigned_integral T>
static inline void mpz_init_set (mpz_ptr a, const T b) { mpz_init_set_ui(a, b); }

static inline int mpz_cmp (mpz_srcptr a, mpz_srcptr b) { return ::mpz_cmp(a, b); }

template<signed_integral T>
static inline int mpz_cmp (mpz_srcptr a, const T b) { return mpz_cmp_si(a, b); }

template<unsigned_integral T>
static inline int mpz_cmp (mpz_srcptr a, const T b) { return mpz_cmp_ui(a, b); }

static inline void mpz_add (mpz_ptr a, mpz_srcptr b, mpz_srcptr c) { ::mpz_add(a, b, c); }
static inline void mpz_sub (mpz_ptr a, mpz_srcptr b, mpz_srcptr c) { ::mpz_sub(a, b, c); }
static inline void mpz_mul (mpz_ptr a, mpz_srcptr b, mpz_srcptr c) { ::mpz_mul(a, b, c); }

template<unsigned_integral T>
static inline void mpz_add (mpz_ptr a, mpz_srcptr b, const T c) { mpz_add_ui(a, b, c); }
template<signed_integral T>
static inline void mpz_add (mpz_ptr a, mpz_srcptr b, const T c)
{
    if (c >= 0)
        mpz_add_ui(a, b, (unsigned long) c);
    else
        mpz_sub_ui(a, b, -(unsigned long) c);
}

template<unsigned_integral T>
static inline void mpz_sub (mpz_ptr a, mpz_srcptr b, const T c) { mpz_sub_ui(a, b, c); }
template<signed_integral T>
static inline void mpz_sub (mpz_ptr a, mpz_srcptr b, const T c)
{
    if (c >= 0)
        mpz_sub_ui(a, b, (unsigned long) c);
    else
        mpz_add_ui(a, b, -(unsigned long) c);
}
template<unsigned_integral T>
static inline void mpz_sub (mpz_ptr a, const T b, mpz_srcptr c) { mpz_ui_sub(a, b, c); }
template<signed_integral T>
static inline void mpz_sub (mpz_ptr a, const T b, mpz_srcptr c)
{
    mpz_sub(a, c, b);
    mpz_neg(a, a);
}

template<unsigned_integral T>
static inline void mpz_mul (mpz_ptr a, mpz_srcptr b, const T c) { mpz_mul_ui(a, b, c); }
template<signed_integral T>
static inline void mpz_mul (mpz_ptr a, mpz_srcptr b, const T c) { mpz_mul_si(a, b, c); }

} /* namespace gmp_auxx */

#endif	/* ZMODN_GMP_AUXX_HPP */
