#ifndef ZMODN_INTEGER_DIVISION_HPP
#define ZMODN_INTEGER_DIVISION_HPP

#include <vector>

#include "cxx_mpz.hpp"

namespace zmodn {

enum class div_mode {
    /* 0 <= r < |d| */
    nonnegative,
    /* -|d|/2 < r <= |d|/2 */
    balanced,
};

struct division_result {
    cxx_mpz quotient;
    cxx_mpz remainder;
};

/* Division with remainder: num == quotient * denom + remainder, with the
 * range of the remainder given by the mode. Throws division_by_zero if
 * denom is zero.
 */
division_result divide(cxx_mpz const & num, cxx_mpz const & denom,
                       div_mode mode = div_mode::nonnegative);

/* one step a = q * b + r of the Euclidean algorithm */
struct euclidean_step {
    cxx_mpz a, b, q, r;
};

/* All the division steps performed by the Euclidean algorithm on (a, b),
 * the last one having a zero remainder. Throws division_by_zero if b is
 * zero.
 */
std::vector<euclidean_step> euclidean_steps(cxx_mpz const & a,
                                            cxx_mpz const & b,
                                            div_mode mode = div_mode::nonnegative);

} /* namespace zmodn */

#endif	/* ZMODN_INTEGER_DIVISION_HPP */
