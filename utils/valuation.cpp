#include "zmodn.h" // IWYU pragma: keep

#include <gmp.h>

#include "valuation.hpp"
#include "arithmetic_errors.hpp"
#include "cxx_mpz.hpp"
#include "macros.h"

namespace zmodn {

padic_decomposition padic(cxx_mpz const & num, cxx_mpz const & base)
{
    if (base < 2)
        throw invalid_base(base);
    if (num.sgn() == 0)
        throw undefined_valuation(base);

    padic_decomposition res;
    /* base need not be prime here; mpz_remove divides by base as long
     * as the division is exact, which is exactly what we want. */
    res.exponent = mpz_remove(res.residual, num, base);

    ASSERT_EXPENSIVE(!mpz_divisible_p(res.residual, base));
    return res;
}

} /* namespace zmodn */
