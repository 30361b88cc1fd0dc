#include "zmodn.h" // IWYU pragma: keep

#include <utility>

#include <gmp.h>

#include "euclid.hpp"
#include "integer_division.hpp"
#include "arithmetic_errors.hpp"
#include "cxx_mpz.hpp"
#include "macros.h"

/* All loops below use balanced remainders, |r| <= |b|/2, so that the
 * number of iterations is at most log2(min(|a|,|b|)) + 1.
 */

namespace zmodn {

cxx_mpz gcd(cxx_mpz const & a, cxx_mpz const & b)
{
    if (a.sgn() == 0 && b.sgn() == 0)
        throw undefined_gcd();

    cxx_mpz u = a;
    cxx_mpz v = b;
    while (v.sgn() != 0) {
        cxx_mpz r = divide(u, v, div_mode::balanced).remainder;
        u = std::move(v);
        v = std::move(r);
    }
    mpz_abs(u, u);
    return u;
}

cxx_mpz lcm(cxx_mpz const & a, cxx_mpz const & b)
{
    if (a.sgn() == 0 || b.sgn() == 0)
        throw undefined_lcm(a, b);

    cxx_mpz m;
    mpz_divexact(m, a, gcd(a, b));
    mpz_mul(m, m, b);
    return m;
}

bezout_coefficients bezout(cxx_mpz const & a, cxx_mpz const & b)
{
    if (a.sgn() == 0 && b.sgn() == 0)
        throw undefined_gcd();

    if (b.sgn() == 0) {
        bezout_coefficients res { a.sgn(), 0, a };
        mpz_abs(res.d, res.d);
        return res;
    }

    /* Invariant, with v the divisor and r the remainder of the
     * current step:
     *      a * xx + b * yy == v
     *      a * x  + b * y  == r
     * and the next remainder u - q*v gets the coefficients xx - q*x.
     */
    cxx_mpz u = a;
    cxx_mpz v = b;
    division_result step = divide(u, v, div_mode::balanced);
    cxx_mpz r = std::move(step.remainder);
    cxx_mpz xx = 0, x = 1;
    cxx_mpz yy = 1, y = -step.quotient;

    while (r.sgn() != 0) {
        u = std::move(v);
        v = std::move(r);
        step = divide(u, v, div_mode::balanced);
        r = std::move(step.remainder);
        cxx_mpz const & q = step.quotient;

        cxx_mpz t = xx;
        mpz_submul(t, q, x);
        xx = std::move(x);
        x = std::move(t);

        t = yy;
        mpz_submul(t, q, y);
        yy = std::move(y);
        y = std::move(t);
    }

    /* v is the last nonzero remainder, and a * xx + b * yy == v */
    bezout_coefficients res { std::move(xx), std::move(yy), std::move(v) };
    if (res.d.sgn() < 0) {
        mpz_neg(res.x, res.x);
        mpz_neg(res.y, res.y);
        mpz_neg(res.d, res.d);
    }
    ASSERT_EXPENSIVE(a * res.x + b * res.y == res.d);
    return res;
}

} /* namespace zmodn */
