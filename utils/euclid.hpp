#ifndef ZMODN_EUCLID_HPP
#define ZMODN_EUCLID_HPP

#include "cxx_mpz.hpp"

namespace zmodn {

/* a*x + b*y == d == gcd(a, b) */
struct bezout_coefficients {
    cxx_mpz x;
    cxx_mpz y;
    cxx_mpz d;
};

/* Nonnegative gcd. Throws undefined_gcd for gcd(0, 0). */
cxx_mpz gcd(cxx_mpz const & a, cxx_mpz const & b);

/* (a / gcd(a, b)) * b, so the sign is that of a*b. Throws undefined_lcm
 * if either operand is zero. */
cxx_mpz lcm(cxx_mpz const & a, cxx_mpz const & b);

/* Extended Euclidean algorithm. Throws undefined_gcd for (0, 0). */
bezout_coefficients bezout(cxx_mpz const & a, cxx_mpz const & b);

} /* namespace zmodn */

#endif	/* ZMODN_EUCLID_HPP */
