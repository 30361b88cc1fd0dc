#include "zmodn.h" // IWYU pragma: keep

#include <cstdlib>

#include <string>

#include <gmp.h>
#include "fmt/format.h"

#include "arithmetic_errors.hpp"
#include "cxx_mpz.hpp"
#include "factor.hpp"
#include "prime_power_factorization.hpp"
#include "macros.h"
#include "tests_common.h"

static bool
test_one_with_ref(cxx_mpz const & n, std::string const & ref)
{
    auto const F = zmodn::factor(n);
    std::string const s = fmt::format("{}", F);
    if (s != ref) {
        fmt::print(stderr, "ERROR: factor({}) = {}, expected {}\n", n, s, ref);
        return false;
    }
    return true;
}

static bool
tests_static()
{
    bool ok = true;
    ok &= test_one_with_ref(1, "1");
    ok &= test_one_with_ref(-1, "1");
    ok &= test_one_with_ref(2, "2");
    ok &= test_one_with_ref(720, "2^4*3^2*5");
    ok &= test_one_with_ref(-720, "2^4*3^2*5");
    ok &= test_one_with_ref(1UL << 40, "2^40");
    /* primes above the trial division bound */
    ok &= test_one_with_ref(10007L * 10009L, "10007*10009");
    ok &= test_one_with_ref(10007L * 10007L * 10007L, "10007^3");
    ok &= test_one_with_ref("1000000016000000063"_mpz, "1000000007*1000000009");
    ok &= test_one_with_ref(3UL * 10007UL * 10007UL * 65537UL,
                            "3*10007^2*65537");
    /* a Carmichael number */
    ok &= test_one_with_ref(561, "3*11*17");
    return ok;
}

static bool
test_zero()
{
    try {
        zmodn::factor(0);
    } catch (zmodn::undefined_factorization const &) {
        return true;
    }
    fmt::print(stderr, "ERROR: factor(0) did not throw\n");
    return false;
}

static bool
tests_dynamic()
{
    bool ok = true;

    unsigned long niter = 50; /* default number of iterations */
    tests_common_get_iter(&niter);
    if (!tests_common_get_quiet())
        fmt::print("tests_dynamic: will perform {} iteration(s)\n", niter);

    cxx_mpz n, p;
    for (unsigned long i = 0; i < niter; ++i) {
        /* products of a few primes of up to 32 bits, some repeated */
        n = 1;
        unsigned long const k = 1 + tests_common_random_ulong(4);
        for (unsigned long j = 0; j < k; j++) {
            tests_common_urandomb(p, 2 + tests_common_random_ulong(31));
            mpz_nextprime(p, p);
            n *= p;
            if (tests_common_random_ulong(4) == 0)
                n *= p;
        }

        auto const F = zmodn::factor(n);
        bool b = F.value() == n;
        for (auto const & [ q, e ] : F)
            b = b && e > 0 && mpz_probab_prime_p(q, 25);
        if (!b) {
            fmt::print(stderr, "ERROR: factor({}) = {}\n", n, F);
            ok = false;
        }
    }

    return ok;
}

int main(int argc, char const * argv[])
{
    tests_common_cmdline(&argc, &argv, PARSE_SEED | PARSE_ITER | PARSE_QUIET);
    bool ok = tests_static();
    ok &= test_zero();
    ok &= tests_dynamic();

    tests_common_clear();
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
