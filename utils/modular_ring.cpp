#include "zmodn.h" // IWYU pragma: keep

#include <map>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <gmp.h>
#include "fmt/format.h"

#include "modular_ring.hpp"
#include "arithmetic_errors.hpp"
#include "arithmetic_functions.hpp"
#include "cxx_mpz.hpp"
#include "euclid.hpp"
#include "factor.hpp"
#include "mod_sqrt.hpp"
#include "modular_arithmetic.hpp"
#include "prime_power_factorization.hpp"
#include "verbose.hpp"

namespace zmodn {

modular_ring::modular_ring(cxx_mpz const & modulus)
    : n(modulus)
{
    if (n < 2)
        throw invalid_modulus(n);
    orders.emplace(1, 1);
    if (n != 2)
        orders.emplace(n - 1, 2);
}

modular_ring::modular_ring(cxx_mpz const & modulus,
                           prime_power_factorization const & F)
    : modular_ring(modulus)
{
    for(auto const & pe : F) {
        if (pe.first < 2 || !mpz_probab_prime_p(pe.first, 25))
            throw invalid_factorization(fmt::format("{} is not a prime", pe.first));
        if (pe.second <= 0)
            throw invalid_factorization(fmt::format("{} has a non-positive exponent in {}", pe.first, F));
    }
    if (F.value() != n)
        throw invalid_factorization(fmt::format("{} is not a factorization of {}", F, n));
    factorization_cache = F;
}

cxx_mpz modular_ring::unit(cxx_mpz const & element) const
{
    cxx_mpz x = elem(element);
    if (gcd(x, n) != 1)
        throw not_invertible(element, n);
    return x;
}

prime_power_factorization const & modular_ring::factorization()
{
    if (!factorization_cache) {
        factorization_cache = factor(n);
        verbose_fmt_print(0, 2, "# {} = {}\n", n, *factorization_cache);
    }
    return *factorization_cache;
}

cxx_mpz const & modular_ring::euler()
{
    if (!euler_cache)
        euler_cache = euler_phi(factorization());
    return *euler_cache;
}

cxx_mpz const & modular_ring::carmichael()
{
    if (!carmichael_cache)
        carmichael_cache = carmichael_lambda(factorization());
    return *carmichael_cache;
}

prime_power_factorization const & modular_ring::carmichael_factorization()
{
    if (!carmichael_factorization_cache)
        carmichael_factorization_cache = factor(carmichael());
    return *carmichael_factorization_cache;
}

std::vector<cxx_mpz> modular_ring::carmichael_primes()
{
    return carmichael_factorization().primes_with_multiplicity();
}

bool modular_ring::is_cyclic()
{
    return euler() == carmichael();
}

std::vector<cxx_mpz> const & modular_ring::multiplicative_group()
{
    if (!multiplicative_group_cache) {
        multiplicative_group_cache = prime_to(factorization());
        verbose_fmt_print(0, 2, "# (Z/{}Z)^* has {} elements\n",
                n, multiplicative_group_cache->size());
    }
    return *multiplicative_group_cache;
}

std::optional<cxx_mpz> modular_ring::generator()
{
    if (!generator_cache && is_cyclic()) {
        for(auto const & x : multiplicative_group()) {
            if (order_of(x) == euler()) {
                generator_cache = x;
                verbose_fmt_print(0, 2, "# generator of (Z/{}Z)^*: {}\n", n, x);
                break;
            }
        }
    }
    return generator_cache;
}

std::vector<cxx_mpz> const & modular_ring::cyclic_realization()
{
    if (!cyclic_realization_cache) {
        auto g = generator();
        if (!g)
            throw not_cyclic(n);
        cyclic_realization_cache = cyclic_subgroup(*g);
    }
    return *cyclic_realization_cache;
}

std::map<cxx_mpz, cxx_mpz> const & modular_ring::discrete_log()
{
    if (!discrete_log_cache) {
        auto const & powers = cyclic_realization();
        std::map<cxx_mpz, cxx_mpz> dlog;
        for(size_t k = 0 ; k < powers.size() ; k++)
            dlog.emplace(powers[k], k);
        discrete_log_cache = std::move(dlog);
    }
    return *discrete_log_cache;
}

cxx_mpz modular_ring::order_of(cxx_mpz const & element)
{
    cxx_mpz const x = unit(element);

    auto it = orders.find(x);
    if (it != orders.end())
        return it->second;

    if (generator_cache) {
        /* (Z/nZ)^* is Z/euler() through the discrete log */
        cxx_mpz const & phi = euler();
        cxx_mpz const o = phi / gcd(discrete_log().at(x), phi);
        orders.emplace(x, o);
        return o;
    }

    /* The order divides carmichael(). We walk the divisor lattice of
     * carmichael() one prime at a time: after k rounds, powers holds
     * x^e for all the divisors e of carmichael() that are products of k
     * primes at most. The first round where some x^e is 1 gives the
     * order, as the smallest such e.
     */
    std::map<cxx_mpz, cxx_mpz> powers;
    powers.emplace(1, x);
    for(auto const & p : carmichael_primes()) {
        std::map<cxx_mpz, cxx_mpz> new_powers;
        for(auto const & [ e, y ] : powers) {
            cxx_mpz pe = p * e;
            if (powers.find(pe) == powers.end())
                new_powers.emplace(std::move(pe), power_of(y, p));
        }
        /* the map is sorted, so the first hit is the smallest */
        for(auto const & [ e, y ] : new_powers) {
            if (y == 1) {
                orders.emplace(x, e);
                return e;
            }
        }
        powers.merge(new_powers);
    }

    /* x^carmichael() is always 1 for a unit */
    throw std::runtime_error(fmt::format("no order found for {} modulo {}", x, n));
}

std::vector<cxx_mpz> modular_ring::cyclic_subgroup(cxx_mpz const & element)
{
    cxx_mpz const x = unit(element);
    std::vector<cxx_mpz> subgroup { cxx_mpz(1) };
    for(cxx_mpz y = x ; y != 1 ; y = mult({ y, x }))
        subgroup.push_back(y);
    orders.emplace(x, subgroup.size());
    return subgroup;
}

std::map<cxx_mpz, cxx_mpz> const & modular_ring::all_orders()
{
    if (euler() != orders.size()) {
        /* with a generator, orders come from the discrete log */
        if (is_cyclic())
            generator();
        for(auto const & x : multiplicative_group())
            order_of(x);
    }
    return orders;
}

std::vector<cxx_mpz> modular_ring::all_generators()
{
    std::vector<cxx_mpz> res;
    if (!is_cyclic())
        return res;
    cxx_mpz const & phi = euler();
    for(auto const & [ x, o ] : all_orders())
        if (o == phi)
            res.push_back(x);
    return res;
}

cxx_mpz modular_ring::elem(cxx_mpz const & x) const
{
    cxx_mpz r;
    mpz_fdiv_r(r, x, n);
    return r;
}

cxx_mpz modular_ring::add(std::vector<cxx_mpz> const & elements) const
{
    cxx_mpz r = 0;
    for(auto const & x : elements) {
        mpz_add(r, r, x);
        mpz_fdiv_r(r, r, n);
    }
    return r;
}

cxx_mpz modular_ring::mult(std::vector<cxx_mpz> const & elements) const
{
    cxx_mpz r = 1;
    for(auto const & x : elements) {
        mpz_mul(r, r, x);
        mpz_fdiv_r(r, r, n);
    }
    /* n >= 2, so the empty product is 1 mod n */
    return r;
}

cxx_mpz modular_ring::power_of(cxx_mpz const & x, cxx_mpz const & e) const
{
    return mod_power(x, e, n);
}

cxx_mpz modular_ring::inverse_of(cxx_mpz const & x) const
{
    return mod_inverse(x, n);
}

std::vector<cxx_mpz> modular_ring::sqrt_of(cxx_mpz const & x) const
{
    return mod_sqrt(x, n);
}

} /* namespace zmodn */
