#ifndef ZMODN_ARITHMETIC_FUNCTIONS_HPP
#define ZMODN_ARITHMETIC_FUNCTIONS_HPP

#include <vector>

#include "cxx_mpz.hpp"
#include "prime_power_factorization.hpp"

namespace zmodn {

/* Euler's totient of F.value() */
cxx_mpz euler_phi(prime_power_factorization const & F);

/* Carmichael's function, i.e. the exponent of (Z/nZ)^*, for n =
 * F.value() */
cxx_mpz carmichael_lambda(prime_power_factorization const & F);

/* all residues in [1, n) coprime to n = F.value(), ascending. Throws
 * std::length_error if n does not fit in an unsigned long.
 */
std::vector<cxx_mpz> prime_to(prime_power_factorization const & F);

} /* namespace zmodn */

#endif	/* ZMODN_ARITHMETIC_FUNCTIONS_HPP */
