#include "zmodn.h" // IWYU pragma: keep

#include <list>
#include <utility>

#include <gmp.h>
#include "fmt/format.h"
/* fmt/ranges.h is needed to print the list of composites within
 * integer_factorizer::print_progress
 */
#include "fmt/ranges.h" // IWYU pragma: keep

#include "factor.hpp"
#include "arithmetic_errors.hpp"
#include "cxx_mpz.hpp"
#include "prime_power_factorization.hpp"
#include "verbose.hpp"
#include "macros.h"

namespace zmodn {

integer_factorizer::integer_factorizer(cxx_mpz n)
  : N(std::move(n))
{
    if (N.sgn() == 0)
        throw undefined_factorization();
    mpz_abs(cofactor, N); /* easier to work with positive number */
    if (cofactor > 1)
        composites.emplace_back(cofactor);
}

void
integer_factorizer::print_progress(const char * header) const
{
    verbose_fmt_print(0, 2, "# {}:\n#   primes={}\n#   cofactor={} ({} bits)\n"
                            "#   composites={}\n", header, primes, cofactor,
                            cofactor.bits(), composites);
}

bool
integer_factorizer::isprime(cxx_mpz const & n) const
{
    return (mpz_cmpabs_ui(n, 1U) > 0 && mpz_cmpabs(n, BB) < 0)
           || mpz_probab_prime_p(n, isprime_niter);
}

void
integer_factorizer::write_as_power(cxx_mpz & r, int & e, cxx_mpz const & n)
{
    if (mpz_perfect_power_p(n) && n > 1) {
        /* GMP does not tell us which power it is. We want the largest
         * one, so that r is not itself a perfect power. */
        for (e = int(n.bits()) - 1; e > 1; --e) {
            if (mpz_root(r, n, e)) {
                break;
            }
        }
        ASSERT_ALWAYS(e > 1);
    } else {
        r = n;
        e = 1;
    }
}

void
integer_factorizer::push_prime(cxx_mpz const & p)
{
    int const exp = mpz_remove(cofactor, cofactor, p);
    ASSERT_ALWAYS(exp > 0);
    ASSERT_ALWAYS(primes.find(p) == primes.end());
    verbose_fmt_print(0, 2, "# adding {}^{} to the list of prime "
                            "factors\n", p, exp);
    primes.emplace(p, exp);
}

void
integer_factorizer::tidy()
{
    for (auto it = composites.begin(); it != composites.end(); ) {
        for (auto const & pe : primes)
            mpz_remove(*it, *it, pe.first);
        if (*it == 1) {
            it = composites.erase(it);
            continue;
        }
        cxx_mpz r;
        int e;
        write_as_power(r, e, *it);
        if (isprime(r)) {
            push_prime(r);
            it = composites.erase(it);
        } else {
            if (e > 1) {
                verbose_fmt_print(0, 2, "# updating composite from {0} to {1}"
                                        " using {0}={1}^{2}\n", *it, r, e);
            }
            *it = std::move(r);
            ++it;
        }
    }
}

void
integer_factorizer::trial_division_up_to(unsigned long bound)
{
    if (bound <= B) {
        /* nothing to do: trial division was already done with a larger bound */
        return;
    }

    for (cxx_mpz p = 2; p < bound; mpz_nextprime(p, p)) {
        if (mpz_divisible_p(cofactor, p))
            push_prime(p);
        if (is_complete())
            break;
    }

    B = bound;
    BB = B;
    mpz_mul(BB, BB, BB);

    tidy();

    print_progress("After trial division");
}

/* Brent's variant of Pollard's rho, with x -> x^2 + c */
cxx_mpz
integer_factorizer::pollard_brent_rho(cxx_mpz const & n, unsigned long c)
{
    const unsigned long m = 128;
    cxx_mpz x, y = 2, ys, q = 1, g = 1, t;

    for (unsigned long r = 1; g == 1; r *= 2) {
        x = y;
        for (unsigned long i = 0; i < r; i++) {
            mpz_mul(y, y, y);
            mpz_add_ui(y, y, c);
            mpz_mod(y, y, n);
        }
        for (unsigned long k = 0; k < r && g == 1; k += m) {
            ys = y;
            for (unsigned long i = 0; i < m && i < r - k; i++) {
                mpz_mul(y, y, y);
                mpz_add_ui(y, y, c);
                mpz_mod(y, y, n);
                mpz_sub(t, x, y);
                mpz_mul(q, q, t);
                mpz_mod(q, q, n);
            }
            mpz_gcd(g, q, n);
        }
    }

    if (g == n) {
        /* we overshot, backtrack one step at a time */
        do {
            mpz_mul(ys, ys, ys);
            mpz_add_ui(ys, ys, c);
            mpz_mod(ys, ys, n);
            mpz_sub(t, x, ys);
            mpz_gcd(g, t, n);
        } while (g == 1);
    }
    return g;
}

void
integer_factorizer::do_rho()
{
    tidy();
    while (!composites.empty()) {
        auto it = composites.begin();
        cxx_mpz f;
        for (unsigned long c = 1; ; c++) {
            verbose_fmt_print(0, 2, "rho: c={}; target={}\n", c, *it);
            f = pollard_brent_rho(*it, c);
            if (f != *it)
                break;
        }
        verbose_fmt_print(0, 2, "# factor found: {}\n", f);
        cxx_mpz cf;
        mpz_divexact(cf, *it, f);
        *it = std::move(f);
        composites.push_back(std::move(cf));
        tidy();
    }
    print_progress("After rho");
}

prime_power_factorization factor(cxx_mpz const & n)
{
    integer_factorizer fact(n);
    fact.factor_using_default_strategy();
    ASSERT_ALWAYS(fact.is_complete());
    return fact.prime_factors();
}

} /* namespace zmodn */
