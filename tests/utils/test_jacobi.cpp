#include "zmodn.h" // IWYU pragma: keep

#include <cstdlib>

#include <vector>

#include <gmp.h>
#include "fmt/format.h"
#include "fmt/ranges.h" // IWYU pragma: keep

#include "arithmetic_errors.hpp"
#include "cxx_mpz.hpp"
#include "jacobi.hpp"
#include "macros.h"
#include "tests_common.h"

static bool
tests_static()
{
    bool ok = true;

    std::vector<int> const ref { 0, 1, 1, 0, 1, 0, 0, -1, 1, 0, 0, -1, 0, -1, -1 };
    std::vector<int> got;
    for (int a = 0; a < 15; a++)
        got.push_back(zmodn::jacobi(a, 15));
    if (got != ref) {
        fmt::print(stderr, "ERROR: (a | 15) for a = 0..14 is {}, expected {}\n",
                           got, ref);
        ok = false;
    }

    ok &= zmodn::jacobi(12345, 1) == 1;
    ok &= zmodn::jacobi(0, 1) == 1;
    ok &= zmodn::jacobi(-1, 7) == -1;
    ok &= zmodn::jacobi(-1, 13) == 1;
    ok &= zmodn::jacobi(2, 7) == 1;
    ok &= zmodn::jacobi(2, 5) == -1;
    ok &= zmodn::jacobi(1001, 9907) == -1;

    if (!ok)
        fmt::print(stderr, "ERROR: static jacobi checks failed\n");

    return ok;
}

static bool
test_errors()
{
    bool ok = true;
    for (int b : { 0, 2, 10, -3 }) {
        try {
            zmodn::jacobi(5, b);
            fmt::print(stderr, "ERROR: jacobi(5, {}) did not throw\n", b);
            ok = false;
        } catch (zmodn::undefined_jacobi_symbol const &) {
        }
    }
    return ok;
}

static bool
tests_dynamic()
{
    bool ok = true;

    unsigned long niter = 500; /* default number of iterations */
    tests_common_get_iter(&niter);
    if (!tests_common_get_quiet())
        fmt::print("tests_dynamic: will perform {} iteration(s)\n", niter);

    cxx_mpz a, b;
    for (unsigned long i = 0; i < niter; ++i) {
        tests_common_urandomb(a, 1 + tests_common_random_ulong(300));
        tests_common_urandomb(b, 1 + tests_common_random_ulong(300));
        mpz_setbit(b, 0);
        if (i & 1)
            mpz_neg(a, a);
        int const j = zmodn::jacobi(a, b);
        int const ref = mpz_jacobi(a, b);
        if (j != ref) {
            fmt::print(stderr, "ERROR: ( {} | {} ) = {}, expected {}\n",
                               a, b, j, ref);
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
