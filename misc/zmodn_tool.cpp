#include "zmodn.h" // IWYU pragma: keep

#include <cstdio>
#include <cstdlib>

#include <string>
#include <vector>

#include <gmp.h>
#include "fmt/format.h"
#include "fmt/ranges.h" // IWYU pragma: keep

#include "arithmetic_errors.hpp"
#include "cxx_mpz.hpp"
#include "euclid.hpp"
#include "integer_division.hpp"
#include "jacobi.hpp"
#include "modular_ring.hpp"
#include "params.hpp"
#include "prime_power_factorization.hpp"
#include "verbose.hpp"

static void
usage (cxx_param_list & pl, const char *argv0, const char * msg = nullptr)
{
    param_list_print_usage(pl, argv0, stderr);
    if (msg)
        fmt::print(stderr, "{}\n", msg);
    exit(EXIT_FAILURE);
}

struct command_line
{
    cxx_mpz modulus;
    zmodn::prime_power_factorization known_factorization;
    bool has_factorization = false;
    std::vector<cxx_mpz> elements;
    std::vector<cxx_mpz> euclid;
    std::vector<cxx_mpz> jacobi;
    int orders = 0;
    int generators = 0;
    int dlog = 0;
    int balanced = 0;

    static void declare_usage(cxx_param_list & pl) {
        param_list_usage_header(pl, "Structure of the multiplicative group "
                                    "of Z/NZ, and some elementary number "
                                    "theory.\n");
        param_list_decl_usage(pl, "modulus", "the modulus N");
        param_list_decl_usage(pl, "factorization",
                              "known factorization of N, e.g. 2^3*5");
        param_list_decl_usage(pl, "element",
                              "comma-separated elements of Z/NZ to examine");
        param_list_decl_usage(pl, "orders", "print the orders of all units");
        param_list_decl_usage(pl, "generators", "print all generators");
        param_list_decl_usage(pl, "dlog", "print the discrete log table");
        param_list_decl_usage(pl, "euclid",
                              "a,b: print the steps of Euclid's algorithm");
        param_list_decl_usage(pl, "balanced",
                              "use balanced remainders with -euclid");
        param_list_decl_usage(pl, "jacobi", "a,b: print the Jacobi symbol");
        param_list_decl_usage(pl, "config", "read parameters from this file");
        verbose_decl_usage(pl);
    }

    void configure_switches(cxx_param_list & pl)
    {
        param_list_configure_switch(pl, "-orders", &orders);
        param_list_configure_switch(pl, "-generators", &generators);
        param_list_configure_switch(pl, "-dlog", &dlog);
        param_list_configure_switch(pl, "-balanced", &balanced);
        param_list_configure_alias(pl, "modulus", "-N");
    }

    void lookup_parameters(cxx_param_list & pl)
    {
        param_list_parse(pl, "modulus", modulus);
        has_factorization = param_list_parse(pl, "factorization",
                                             known_factorization);
        param_list_parse(pl, "element", elements);
        param_list_parse(pl, "euclid", euclid);
        param_list_parse(pl, "jacobi", jacobi);
    }

    void check_inconsistencies(const char * argv0, cxx_param_list & pl) const
    {
        if (!modulus && euclid.empty() && jacobi.empty())
            usage(pl, argv0, "Error, nothing to do");
        if (!modulus && (has_factorization || !elements.empty() || orders || generators || dlog))
            usage(pl, argv0, "Error, -modulus is needed");
        if (!euclid.empty() && euclid.size() != 2)
            usage(pl, argv0, "Error, -euclid wants exactly two integers");
        if (!jacobi.empty() && jacobi.size() != 2)
            usage(pl, argv0, "Error, -jacobi wants exactly two integers");
    }
};

static void print_euclid(cxx_mpz const & a, cxx_mpz const & b, bool balanced)
{
    auto mode = balanced ? zmodn::div_mode::balanced : zmodn::div_mode::nonnegative;
    for(auto const & s : zmodn::euclidean_steps(a, b, mode))
        fmt::print("{} = {} * {} + {}\n", s.a, s.q, s.b, s.r);
    auto const B = zmodn::bezout(a, b);
    fmt::print("gcd({}, {}) = {} = {} * {} + {} * {}\n",
               a, b, B.d, a, B.x, b, B.y);
}

static void print_ring(zmodn::modular_ring & R, command_line const & cmdline)
{
    cxx_mpz const & N = R.modulus();
    fmt::print("N = {}\n", N);
    fmt::print("factorization: {}\n", R.factorization());
    fmt::print("euler: {}\n", R.euler());
    fmt::print("carmichael: {}\n", R.carmichael());
    fmt::print("cyclic: {}\n", R.is_cyclic() ? "yes" : "no");
    if (auto g = R.generator())
        fmt::print("generator: {}\n", *g);

    bool const prime_modulus = R.factorization().size() == 1
        && R.factorization().begin()->second == 1;

    for(auto const & e : cmdline.elements) {
        cxx_mpz const x = R.elem(e);
        if (zmodn::gcd(x, N) != 1) {
            fmt::print("{} is not a unit modulo {}\n", x, N);
        } else {
            fmt::print("order of {}: {}\n", x, R.order_of(x));
            fmt::print("inverse of {}: {}\n", x, R.inverse_of(x));
        }
        if (prime_modulus)
            fmt::print("square roots of {}: {}\n", x, R.sqrt_of(x));
    }

    if (cmdline.orders) {
        for(auto const & [ x, o ] : R.all_orders())
            fmt::print("order({}) = {}\n", x, o);
    }

    if (cmdline.generators)
        fmt::print("generators: {}\n", R.all_generators());

    if (cmdline.dlog) {
        if (!R.is_cyclic()) {
            fmt::print("no discrete log, (Z/{}Z)^* is not cyclic\n", N);
        } else {
            cxx_mpz const g = *R.generator();
            for(auto const & [ x, k ] : R.discrete_log())
                fmt::print("{} = {}^{}\n", x, g, k);
        }
    }
}

int main(int argc, char const * argv[])
{
    const char *argv0 = argv[0];

    cxx_param_list pl;
    command_line cmdline;

    command_line::declare_usage(pl);
    cmdline.configure_switches(pl);

    argv++, argc--;
    if (argc == 0)
      usage(pl, argv0);

    for( ; argc ; ) {
        if (param_list_update_cmdline(pl, &argc, &argv))
            continue;
        fmt::print(stderr, "Unknown option: {}\n", argv[0]);
        usage(pl, argv0);
    }

    try {
        if (const char * config = param_list_lookup_string(pl, "config")) {
            /* command-line values keep priority over the file */
            if (!param_list_read_file(pl, config))
                usage(pl, argv0, "Error, could not parse the config file");
        }

        verbose_interpret_parameters(pl);
        if (verbose_enabled(0, 2))
            param_list_print_command_line(stdout, pl);

        cmdline.lookup_parameters(pl);
        if (param_list_warn_unused(pl))
            usage(pl, argv0);
        cmdline.check_inconsistencies(argv0, pl);

        if (!cmdline.euclid.empty())
            print_euclid(cmdline.euclid[0], cmdline.euclid[1], cmdline.balanced);

        if (!cmdline.jacobi.empty())
            fmt::print("( {} | {} ) = {}\n", cmdline.jacobi[0], cmdline.jacobi[1],
                       zmodn::jacobi(cmdline.jacobi[0], cmdline.jacobi[1]));

        if (cmdline.modulus) {
            if (cmdline.has_factorization) {
                zmodn::modular_ring R(cmdline.modulus, cmdline.known_factorization);
                print_ring(R, cmdline);
            } else {
                zmodn::modular_ring R(cmdline.modulus);
                print_ring(R, cmdline);
            }
        }
    } catch (zmodn::arithmetic_error const & e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return EXIT_FAILURE;
    } catch (parameter_error const & e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
