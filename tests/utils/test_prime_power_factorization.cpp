#include "zmodn.h" // IWYU pragma: keep

#include <cstdlib>

#include <sstream>
#include <string>
#include <vector>

#include "fmt/format.h"

#include "cxx_mpz.hpp"
#include "prime_power_factorization.hpp"
#include "macros.h"
#include "tests_common.h"

/* both fmt and iostreams go through the operator<< of gmpxx */
static bool
test_print_integer()
{
    bool ok = true;

    cxx_mpz const x = "-123456789012345678901234567890"_mpz;
    std::ostringstream os;
    os << x;
    ok &= os.str() == "-123456789012345678901234567890";
    ok &= fmt::format("{}", x) == os.str();
    ok &= fmt::format("{}", cxx_mpz(0)) == "0";

    if (!ok)
        fmt::print(stderr, "ERROR: integers are not printed correctly\n");
    return ok;
}

static bool
test_value()
{
    bool ok = true;

    zmodn::prime_power_factorization F;
    ok &= F.value() == 1;
    ok &= F.primes_with_multiplicity().empty();

    F[cxx_mpz(2)] = 3;
    F[cxx_mpz(3)] = 2;
    F[cxx_mpz(5)] = 1;
    ok &= F.value() == 360;

    std::vector<cxx_mpz> const P = F.primes_with_multiplicity();
    std::vector<cxx_mpz> const ref { 2, 2, 2, 3, 3, 5 };
    ok &= P == ref;

    if (!ok)
        fmt::print(stderr, "ERROR: value() or primes_with_multiplicity() "
                           "is wrong for {}\n", F);
    return ok;
}

static bool
test_print()
{
    bool ok = true;

    zmodn::prime_power_factorization F;
    std::string s = fmt::format("{}", F);
    if (s != "1") {
        fmt::print(stderr, "ERROR: empty factorization prints as {}\n", s);
        ok = false;
    }

    F[cxx_mpz(7)] = 1;
    F[cxx_mpz(2)] = 3;
    F["1000000007"_mpz] = 2;
    s = fmt::format("{}", F);
    if (s != "2^3*7*1000000007^2") {
        fmt::print(stderr, "ERROR: factorization prints as {}\n", s);
        ok = false;
    }

    return ok;
}

int main(int argc, char const * argv[])
{
    tests_common_cmdline(&argc, &argv, PARSE_QUIET);
    bool ok = test_print_integer();
    ok &= test_value();
    ok &= test_print();

    tests_common_clear();
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
