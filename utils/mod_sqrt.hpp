#ifndef ZMODN_MOD_SQRT_HPP
#define ZMODN_MOD_SQRT_HPP

#include <vector>

#include "cxx_mpz.hpp"

namespace zmodn {

/* All square roots of a modulo the prime p, ascending: {} if a is not a
 * square, {0} if a == 0 mod p, two roots otherwise (one if p == 2).
 * Throws invalid_modulus if p is not a prime.
 */
std::vector<cxx_mpz> mod_sqrt(cxx_mpz const & a, cxx_mpz const & p);

} /* namespace zmodn */

#endif	/* ZMODN_MOD_SQRT_HPP */
