#include "zmodn.h" // IWYU pragma: keep

#include <cstdlib>

#include <gmp.h>
#include "fmt/format.h"

#include "arithmetic_errors.hpp"
#include "cxx_mpz.hpp"
#include "valuation.hpp"
#include "macros.h"
#include "tests_common.h"

static bool
test_one_with_ref(cxx_mpz const & num, cxx_mpz const & base,
                  unsigned long e_ref, cxx_mpz const & r_ref)
{
    auto const [ e, r ] = zmodn::padic(num, base);
    if (e != e_ref || r != r_ref) {
        fmt::print(stderr, "ERROR: padic({}, {}): expected ({}, {}), "
                           "got ({}, {})\n", num, base, e_ref, r_ref, e, r);
        return false;
    }
    return true;
}

static bool
tests_static()
{
    bool ok = true;
    ok &= test_one_with_ref(48, 2, 4, 3);
    ok &= test_one_with_ref(-48, 2, 4, -3);
    ok &= test_one_with_ref(7, 2, 0, 7);
    ok &= test_one_with_ref(1, 5, 0, 1);
    ok &= test_one_with_ref(1000, 10, 3, 1);
    /* the base needs not be prime */
    ok &= test_one_with_ref(180, 6, 2, 5);
    ok &= test_one_with_ref("340282366920938463463374607431768211456"_mpz, 2, 128, 1);
    return ok;
}

static bool
test_errors()
{
    bool ok = true;
    try {
        zmodn::padic(0, 3);
        fmt::print(stderr, "ERROR: padic(0, 3) did not throw\n");
        ok = false;
    } catch (zmodn::undefined_valuation const &) {
    }
    for (int base : { 1, 0, -2 }) {
        try {
            zmodn::padic(12, base);
            fmt::print(stderr, "ERROR: padic(12, {}) did not throw\n", base);
            ok = false;
        } catch (zmodn::invalid_base const &) {
        }
    }
    return ok;
}

static bool
tests_dynamic()
{
    bool ok = true;

    unsigned long niter = 200; /* default number of iterations */
    tests_common_get_iter(&niter);
    if (!tests_common_get_quiet())
        fmt::print("tests_dynamic: will perform {} iteration(s)\n", niter);

    cxx_mpz num, base, pe;
    for (unsigned long i = 0; i < niter; ++i) {
        do {
            tests_common_urandomb(num, 300);
        } while (num == 0);
        do {
            tests_common_urandomb(base, 1 + tests_common_random_ulong(20));
        } while (base < 2);
        /* make sure that there is something to remove */
        mpz_pow_ui(pe, base, tests_common_random_ulong(10));
        num *= pe;
        if (i & 1)
            mpz_neg(num, num);

        auto const [ e, r ] = zmodn::padic(num, base);
        mpz_pow_ui(pe, base, e);
        if (pe * r != num || mpz_divisible_p(r, base)) {
            fmt::print(stderr, "ERROR: padic({}, {}) = ({}, {})\n",
                               num, base, e, r);
            ok = false;
        }
    }

    return ok;
}

int main(int argc, char const * argv[])
{
    tests_common_cmdline(&argc, &argv, PARSE_SEED | PARSE_ITER | PARSE_QUIET);
    bool ok = tests_static();
    ok &= test_errors();
    ok &= tests_dynamic();

    tests_common_clear();
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
