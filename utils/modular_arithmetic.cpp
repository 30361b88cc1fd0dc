#include "zmodn.h" // IWYU pragma: keep

#include <gmp.h>

#include "modular_arithmetic.hpp"
#include "euclid.hpp"
#include "arithmetic_errors.hpp"
#include "cxx_mpz.hpp"

namespace zmodn {

static void check_modulus(cxx_mpz const & mod)
{
    if (mod < 2)
        throw invalid_modulus(mod);
}

cxx_mpz mod_inverse(cxx_mpz const & num, cxx_mpz const & mod)
{
    check_modulus(mod);
    if (gcd(num, mod) != 1)
        throw not_invertible(num, mod);

    cxx_mpz inv = bezout(num, mod).x;
    mpz_fdiv_r(inv, inv, mod);
    return inv;
}

cxx_mpz mod_power(cxx_mpz const & num, cxx_mpz const & exp,
                  cxx_mpz const & mod)
{
    check_modulus(mod);

    if (exp.sgn() < 0)
        return mod_power(mod_inverse(num, mod), -exp, mod);

    /* right-to-left binary exponentiation: at step i, base holds
     * num^(2^i) mod mod */
    cxx_mpz res = 1;
    cxx_mpz base;
    mpz_fdiv_r(base, num, mod);

    size_t const nbits = exp.sgn() == 0 ? 0 : exp.bits();
    for (size_t i = 0; i < nbits; i++) {
        if (mpz_tstbit(exp, i)) {
            mpz_mul(res, res, base);
            mpz_fdiv_r(res, res, mod);
        }
        if (i + 1 < nbits) {
            mpz_mul(base, base, base);
            mpz_fdiv_r(base, base, mod);
        }
    }
    return res;
}

} /* namespace zmodn */
