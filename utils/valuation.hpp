#ifndef ZMODN_VALUATION_HPP
#define ZMODN_VALUATION_HPP

#include "cxx_mpz.hpp"

namespace zmodn {

/* num == base^exponent * residual, with residual not divisible by base */
struct padic_decomposition {
    unsigned long exponent;
    cxx_mpz residual;
};

/* Throws invalid_base if base < 2, and undefined_valuation if num is 0
 * (zero is divisible by every power of base). The residual has the sign
 * of num.
 */
padic_decomposition padic(cxx_mpz const & num, cxx_mpz const & base);

} /* namespace zmodn */

#endif	/* ZMODN_VALUATION_HPP */
