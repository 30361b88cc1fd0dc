#ifndef ZMODN_MODULAR_ARITHMETIC_HPP
#define ZMODN_MODULAR_ARITHMETIC_HPP

#include "cxx_mpz.hpp"

namespace zmodn {

/* Returns inv with 0 < inv < mod and num * inv == 1 mod mod.
 * Throws invalid_modulus if mod < 2, and not_invertible if num and mod
 * are not coprime.
 */
cxx_mpz mod_inverse(cxx_mpz const & num, cxx_mpz const & mod);

/* Returns num^exp mod mod, in [0, mod). Negative exponents are
 * understood as powers of the inverse of num.
 */
cxx_mpz mod_power(cxx_mpz const & num, cxx_mpz const & exp,
                  cxx_mpz const & mod);

} /* namespace zmodn */

#endif	/* ZMODN_MODULAR_ARITHMETIC_HPP */
