#include "zmodn.h" // IWYU pragma: keep

#include <ostream>
#include <vector>

#include <gmp.h>

#include "prime_power_factorization.hpp"
#include "cxx_mpz.hpp"
#include "macros.h"

namespace zmodn {

cxx_mpz prime_power_factorization::value() const
{
    cxx_mpz v = 1;
    for(auto const & [ p, e ] : *this) {
        ASSERT_ALWAYS(e > 0);
        cxx_mpz pe;
        mpz_pow_ui(pe, p, e);
        mpz_mul(v, v, pe);
    }
    return v;
}

std::vector<cxx_mpz> prime_power_factorization::primes_with_multiplicity() const
{
    std::vector<cxx_mpz> res;
    for(auto const & [ p, e ] : *this)
        for(int i = 0 ; i < e ; i++)
            res.push_back(p);
    return res;
}

/* same syntax as what param_list_parse understands: 2^3*3*7^2 */
std::ostream & operator<<(std::ostream & os, prime_power_factorization const & F)
{
    if (F.empty())
        return os << 1;
    const char * sep = "";
    for(auto const & [ p, e ] : F) {
        os << sep << p;
        if (e != 1)
            os << "^" << e;
        sep = "*";
    }
    return os;
}

} /* namespace zmodn */
