#include "zmodn.h" // IWYU pragma: keep

#include <utility>

#include <gmp.h>

#include "jacobi.hpp"
#include "euclid.hpp"
#include "integer_division.hpp"
#include "valuation.hpp"
#include "arithmetic_errors.hpp"
#include "cxx_mpz.hpp"

namespace zmodn {

/* This is the recursive law
 *      ( a | 1 ) = 1
 *      ( a | b ) = 0 if gcd(a, b) != 1
 *      ( a | b ) = (-1)^(e (b^2-1)/8) * (-1)^((a'-1)(b-1)/4) * ( b | a' )
 *                      where a mod b = 2^e * a', a' odd,
 * unrolled into a loop. Since 0 < a' < b, b decreases strictly.
 */
int jacobi(cxx_mpz const & a, cxx_mpz const & b)
{
    if (!b.is_odd() || b.sgn() < 0)
        throw undefined_jacobi_symbol(a, b);

    if (b == 1)
        return 1;

    /* gcd(b, a') divides gcd(b, a mod b) == gcd(a, b), so checking once
     * is enough for all the rounds below. */
    if (gcd(a, b) != 1)
        return 0;

    int sign = 1;
    cxx_mpz x = a;
    cxx_mpz m = b;
    for (;;) {
        if (m == 1)
            return sign;

        cxx_mpz const rem = divide(x, m).remainder;
        padic_decomposition p = padic(rem, 2);

        unsigned long const m8 = mpz_fdiv_ui(m, 8);
        if ((p.exponent & 1) && (m8 == 3 || m8 == 5))
            sign = -sign;

        if (p.residual == 1)
            return sign;

        if (mpz_fdiv_ui(m, 4) == 3 && mpz_fdiv_ui(p.residual, 4) == 3)
            sign = -sign;

        x = std::move(m);
        m = std::move(p.residual);
    }
}

} /* namespace zmodn */
