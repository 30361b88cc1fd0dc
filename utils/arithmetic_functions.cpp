#include "zmodn.h" // IWYU pragma: keep

#include <stdexcept>
#include <vector>

#include <gmp.h>
#include "fmt/format.h"

#include "arithmetic_functions.hpp"
#include "euclid.hpp"
#include "cxx_mpz.hpp"
#include "prime_power_factorization.hpp"
#include "macros.h"

namespace zmodn {

/* phi(p^e) = p^(e-1) * (p-1) */
static cxx_mpz euler_phi_prime_power(cxx_mpz const & p, int e)
{
    ASSERT_ALWAYS(e > 0);
    cxx_mpz r;
    mpz_pow_ui(r, p, e - 1);
    mpz_mul(r, r, p - 1);
    return r;
}

cxx_mpz euler_phi(prime_power_factorization const & F)
{
    cxx_mpz r = 1;
    for(auto const & [ p, e ] : F)
        r *= euler_phi_prime_power(p, e);
    return r;
}

cxx_mpz carmichael_lambda(prime_power_factorization const & F)
{
    cxx_mpz r = 1;
    for(auto const & [ p, e ] : F) {
        cxx_mpz l;
        if (p == 2 && e >= 3) {
            /* (Z/2^eZ)^* is Z/2 x Z/2^(e-2) */
            mpz_set_ui(l, 1);
            mpz_mul_2exp(l, l, e - 2);
        } else {
            l = euler_phi_prime_power(p, e);
        }
        r = lcm(r, l);
    }
    return r;
}

std::vector<cxx_mpz> prime_to(prime_power_factorization const & F)
{
    cxx_mpz const N = F.value();
    if (!N.fits<unsigned long>())
        throw std::length_error(fmt::format("cannot enumerate the {} residues modulo {}", euler_phi(F), N));
    unsigned long const n = mpz_get_ui(N);

    std::vector<bool> coprime(n, true);
    if (n > 0)
        coprime[0] = false;
    for(auto const & pe : F) {
        unsigned long const p = mpz_get_ui(pe.first);
        for(unsigned long k = p ; k < n ; k += p)
            coprime[k] = false;
    }

    std::vector<cxx_mpz> res;
    for(unsigned long i = 1 ; i < n ; i++)
        if (coprime[i])
            res.emplace_back(i);
    return res;
}

} /* namespace zmodn */
