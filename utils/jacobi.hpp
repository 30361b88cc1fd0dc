#ifndef ZMODN_JACOBI_HPP
#define ZMODN_JACOBI_HPP

#include "cxx_mpz.hpp"

namespace zmodn {

/* Jacobi symbol ( a | b ), in {-1, 0, 1}. b must be odd and positive,
 * otherwise undefined_jacobi_symbol is thrown.
 */
int jacobi(cxx_mpz const & a, cxx_mpz const & b);

} /* namespace zmodn */

#endif	/* ZMODN_JACOBI_HPP */
