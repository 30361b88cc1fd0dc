#include "zmodn.h" // IWYU pragma: keep

#include <utility>
#include <vector>

#include <gmp.h>

#include "integer_division.hpp"
#include "arithmetic_errors.hpp"
#include "cxx_mpz.hpp"
#include "macros.h"

namespace zmodn {

division_result divide(cxx_mpz const & num, cxx_mpz const & denom,
                       div_mode mode)
{
    if (denom.sgn() == 0)
        throw division_by_zero(num);

    division_result res;
    cxx_mpz & q = res.quotient;
    cxx_mpz & r = res.remainder;

    /* For a positive denominator this is floor division. For a negative
     * one, rounding the quotient up is what leaves a nonnegative
     * remainder: this is floor(num/denom)+1 unless the division is
     * exact.
     */
    if (denom.sgn() > 0)
        mpz_fdiv_qr(q, r, num, denom);
    else
        mpz_cdiv_qr(q, r, num, denom);

    if (mode == div_mode::balanced) {
        /* r > |denom|/2  <=>  2r > |denom| */
        cxx_mpz twice_r;
        mpz_mul_2exp(twice_r, r, 1);
        if (mpz_cmpabs(twice_r, denom) > 0) {
            if (denom.sgn() > 0) {
                mpz_add_ui(q, q, 1);
                mpz_sub(r, r, denom);
            } else {
                mpz_sub_ui(q, q, 1);
                mpz_add(r, r, denom);
            }
        }
    }

    ASSERT_EXPENSIVE(q * denom + r == num);
    return res;
}

std::vector<euclidean_step> euclidean_steps(cxx_mpz const & a,
                                            cxx_mpz const & b,
                                            div_mode mode)
{
    std::vector<euclidean_step> steps;
    cxx_mpz x = a;
    cxx_mpz y = b;
    for (;;) {
        auto [ q, r ] = divide(x, y, mode);
        bool const done = r.sgn() == 0;
        steps.push_back({ x, y, q, r });
        if (done)
            break;
        x = std::move(y);
        y = std::move(r);
    }
    return steps;
}

} /* namespace zmodn */
