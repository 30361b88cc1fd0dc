#include "zmodn.h" // IWYU pragma: keep

#include <cstdlib>

#include <sstream>
#include <string>
#include <vector>

#include "fmt/format.h"

#include "cxx_mpz.hpp"
#include "params.hpp"
#include "prime_power_factorization.hpp"
#include "macros.h"
#include "tests_common.h"

/* feeds a fake command line to pl, returns the number of arguments that
 * were not understood. pl keeps a pointer to argv0, which must outlive
 * it. */
static int
feed_cmdline(cxx_param_list & pl, std::vector<const char *> & argv0)
{
    int argc = (int) argv0.size() - 1;
    char const ** argv = argv0.data() + 1;
    int unknown = 0;
    for( ; argc ; ) {
        if (param_list_update_cmdline(pl, &argc, &argv))
            continue;
        unknown++;
        argv++, argc--;
    }
    return unknown;
}

static bool
test_cmdline()
{
    bool ok = true;
    int verbose = 0;
    std::vector<const char *> args {
            "test_params",
            "-N", "91",
            "-element", "3,-5",
            "--orders",
            "factorization=7*13",
            "-v", "-v",
            "stray",
            };
    cxx_param_list pl;

    param_list_configure_alias(pl, "modulus", "N");
    param_list_configure_switch(pl, "orders", nullptr);
    param_list_configure_switch(pl, "v", &verbose);

    int const unknown = feed_cmdline(pl, args);
    ok &= unknown == 1;

    ok &= param_list_parse<cxx_mpz>(pl, "modulus") == 91;
    ok &= param_list_parse<std::vector<cxx_mpz>>(pl, "element") == std::vector<cxx_mpz>({ 3, -5 });
    ok &= param_list_parse_switch(pl, "-orders") == 1;
    ok &= param_list_parse_switch(pl, "dlog") == 0;
    ok &= verbose == 2;

    zmodn::prime_power_factorization F;
    ok &= param_list_parse(pl, "factorization", F) != 0;
    ok &= F.size() == 2 && F.value() == 91;

    ok &= param_list_warn_unused(pl) == 0;

    unsigned long x = 17;
    ok &= !param_list_parse(pl, "absent", x);
    ok &= x == 17;

    if (!ok)
        fmt::print(stderr, "ERROR: in test_cmdline\n");
    return ok;
}

static bool
test_switch_negation_and_key_folding()
{
    bool ok = true;
    int balanced = 0;
    std::vector<const char *> args {
            "test_params",
            "-balanced", "--no-balanced",
            "-trial_division-bound", "100",
            "--no-such-key", "3",
            };
    cxx_param_list pl;
    param_list_configure_switch(pl, "balanced", &balanced);

    ok &= feed_cmdline(pl, args) == 0;
    ok &= balanced == 0;
    ok &= param_list_parse_switch(pl, "balanced") > 0;
    ok &= param_list_parse<unsigned long>(pl, "trial-division_bound") == 100;
    ok &= param_list_parse<int>(pl, "no-such-key") == 3;
    ok &= param_list_warn_unused(pl) == 0;

    if (!ok)
        fmt::print(stderr, "ERROR: in test_switch_negation_and_key_folding\n");
    return ok;
}

static bool
test_config_file()
{
    bool ok = true;
    std::vector<const char *> args { "test_params", "-modulus", "0x5b" };
    cxx_param_list pl;

    std::istringstream is(
            "# a configuration file\n"
            "modulus = 35   # trailing comment\n"
            "\n"
            "  element: 2,4\n"
            "factorization := 5*7\n"
            "balanced = yes\n"
            "jacobi = 3,7\n");
    ok &= param_list_read(pl, is) != 0;

    /* the command line wins over the file, whatever the order */
    ok &= feed_cmdline(pl, args) == 0;
    std::istringstream is2("modulus = 1\n");
    ok &= param_list_read(pl, is2) != 0;

    ok &= param_list_parse<cxx_mpz>(pl, "modulus") == 91;
    ok &= param_list_parse<std::vector<int>>(pl, "element") == std::vector<int>({ 2, 4 });
    ok &= param_list_parse<bool>(pl, "balanced");
    ok &= param_list_parse<zmodn::prime_power_factorization>(pl, "factorization").value() == 35;
    ok &= std::string(param_list_lookup_string(pl, "jacobi")) == "3,7";
    ok &= param_list_lookup_string(pl, "euclid") == nullptr;

    std::istringstream bad("= 3\nmodulus 12\n");
    ok &= !param_list_read(pl, bad);

    if (!ok)
        fmt::print(stderr, "ERROR: in test_config_file\n");
    return ok;
}

static bool
test_factorization_syntax()
{
    bool ok = true;
    cxx_param_list pl;
    param_list_add_key(pl, "a", "2^3*3*5^2", PARAMETER_FROM_CMDLINE);
    param_list_add_key(pl, "b", "2^3,5", PARAMETER_FROM_CMDLINE);
    param_list_add_key(pl, "c", "1", PARAMETER_FROM_CMDLINE);
    param_list_add_key(pl, "d", "1000000007^2", PARAMETER_FROM_CMDLINE);

    ok &= fmt::format("{}", param_list_parse<zmodn::prime_power_factorization>(pl, "a")) == "2^3*3*5^2";
    ok &= param_list_parse<zmodn::prime_power_factorization>(pl, "b").value() == 40;
    ok &= param_list_parse<zmodn::prime_power_factorization>(pl, "c").empty();
    ok &= param_list_parse<zmodn::prime_power_factorization>(pl, "d").value() == "1000000014000000049"_mpz;

    if (!ok)
        fmt::print(stderr, "ERROR: in test_factorization_syntax\n");
    return ok;
}

template<typename T>
static bool
parse_fails(cxx_param_list & pl, const char * key)
{
    try {
        param_list_parse<T>(pl, key);
    } catch (parameter_error const &) {
        return true;
    }
    return false;
}

static bool
test_errors()
{
    bool ok = true;
    cxx_param_list pl;
    param_list_configure_switch(pl, "orders", nullptr);
    param_list_add_key(pl, "n", "12abc", PARAMETER_FROM_CMDLINE);
    param_list_add_key(pl, "b", "maybe", PARAMETER_FROM_CMDLINE);
    param_list_add_key(pl, "f", "2^0*3", PARAMETER_FROM_CMDLINE);
    param_list_add_key(pl, "g", "1*3", PARAMETER_FROM_CMDLINE);
    param_list_add_key(pl, "orders", "3", PARAMETER_FROM_FILE);

    ok &= parse_fails<int>(pl, "n");
    ok &= parse_fails<cxx_mpz>(pl, "n");
    ok &= parse_fails<std::vector<cxx_mpz>>(pl, "n");
    ok &= parse_fails<bool>(pl, "b");
    ok &= parse_fails<zmodn::prime_power_factorization>(pl, "f");
    ok &= parse_fails<zmodn::prime_power_factorization>(pl, "g");

    try {
        param_list_parse_switch(pl, "orders");
        ok = false;
    } catch (parameter_error const &) {
    }

    try {
        param_list_parse_mandatory<cxx_mpz>(pl, "modulus");
        ok = false;
    } catch (parameter_error const &) {
    }

    try {
        param_list_read_file(pl, "/nonexistent/zmodn.conf");
        ok = false;
    } catch (parameter_error const &) {
    }

    if (!ok)
        fmt::print(stderr, "ERROR: in test_errors\n");
    return ok;
}

int main(int argc, char const * argv[])
{
    tests_common_cmdline(&argc, &argv, PARSE_QUIET);
    bool ok = test_cmdline();
    ok &= test_switch_negation_and_key_folding();
    ok &= test_config_file();
    ok &= test_factorization_syntax();
    ok &= test_errors();

    tests_common_clear();
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
