#include "zmodn.h" // IWYU pragma: keep

#include <utility>
#include <vector>

#include <gmp.h>

#include "mod_sqrt.hpp"
#include "modular_arithmetic.hpp"
#include "jacobi.hpp"
#include "arithmetic_errors.hpp"
#include "cxx_mpz.hpp"
#include "macros.h"

namespace zmodn {

/* Tonelli-Shanks, following the description of Crandall-Pomerance,
 * page 94. p is an odd prime and a a nonzero square mod p. */
static cxx_mpz tonelli_shanks(cxx_mpz const & a, cxx_mpz const & p)
{
    // (s,t) s.t. p-1 = 2^s*t, t odd
    cxx_mpz t = p - 1;
    unsigned long const s = mpz_scan1(t, 0);
    mpz_fdiv_q_2exp(t, t, s);

    // find a non quadratic residue delta
    cxx_mpz delta = 2;
    for( ; jacobi(delta, p) != -1 ; delta += 1);

    cxx_mpz const A = mod_power(a, t, p);
    cxx_mpz const D = mod_power(delta, t, p);
    cxx_mpz const minus_one = p - 1;
    cxx_mpz m = 0;
    for (unsigned long i = 0; i < s; ++i) {
        cxx_mpz aux = mod_power(D, m, p);
        aux = (aux * A) % p;
        cxx_mpz e;
        mpz_setbit(e, s - 1 - i);
        if (mod_power(aux, e, p) == minus_one)
            mpz_setbit(m, i);
    }
    /* now A * D^m == 1, and m is even */
    ASSERT_ALWAYS(!m.is_odd());

    mpz_add_ui(t, t, 1);
    mpz_divexact_ui(t, t, 2U);
    mpz_divexact_ui(m, m, 2U);
    return (mod_power(a, t, p) * mod_power(D, m, p)) % p;
}

std::vector<cxx_mpz> mod_sqrt(cxx_mpz const & a, cxx_mpz const & p)
{
    if (p < 2)
        throw invalid_modulus(p);
    if (!mpz_probab_prime_p(p, 25))
        throw invalid_modulus(p, "prime");

    cxx_mpz r;
    mpz_fdiv_r(r, a, p);

    if (r == 0)
        return { cxx_mpz(0) };
    if (p == 2)
        return { r };
    if (jacobi(r, p) == -1)
        return {};

    cxx_mpz x = tonelli_shanks(r, p);
    cxx_mpz y = p - x;
    if (y < x)
        std::swap(x, y);
    return { x, y };
}

} /* namespace zmodn */
