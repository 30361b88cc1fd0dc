#ifndef ZMODN_MODULAR_RING_HPP
#define ZMODN_MODULAR_RING_HPP

#include <map>
#include <optional>
#include <vector>

#include "cxx_mpz.hpp"
#include "prime_power_factorization.hpp"

namespace zmodn {

/*
 * The ring Z/nZ, and mostly its multiplicative group (Z/nZ)^*.
 *
 * Everything derived from the modulus is computed on first use and kept
 * for the lifetime of the object. The cells depend on each other in this
 * order only:
 *
 *   factorization -> euler, carmichael -> carmichael_factorization
 *     -> order_of -> generator -> cyclic_realization -> discrete_log
 *
 * so that no cell is ever needed to compute itself. References returned
 * by the accessors stay valid as long as the ring does.
 *
 * Filling the caches mutates the object, even from accessors that look
 * like queries. A modular_ring must not be used from several threads
 * without a lock.
 */
class modular_ring
{
    cxx_mpz n;

    /* element -> order, for units only. Entries are never overwritten */
    std::map<cxx_mpz, cxx_mpz> orders;

    std::optional<prime_power_factorization> factorization_cache;
    std::optional<cxx_mpz> euler_cache;
    std::optional<cxx_mpz> carmichael_cache;
    std::optional<prime_power_factorization> carmichael_factorization_cache;
    std::optional<std::vector<cxx_mpz>> multiplicative_group_cache;
    std::optional<cxx_mpz> generator_cache;
    std::optional<std::vector<cxx_mpz>> cyclic_realization_cache;
    std::optional<std::map<cxx_mpz, cxx_mpz>> discrete_log_cache;

    /* element reduced mod n, or not_invertible */
    cxx_mpz unit(cxx_mpz const & element) const;

    public:

    /* throws invalid_modulus if modulus < 2 */
    explicit modular_ring(cxx_mpz const & modulus);

    /* same, with the factorization of the modulus already known. Throws
     * invalid_factorization if F does not factor the modulus into primes.
     */
    modular_ring(cxx_mpz const & modulus, prime_power_factorization const & F);

    cxx_mpz const & modulus() const { return n; }

    prime_power_factorization const & factorization();

    /* size of (Z/nZ)^* */
    cxx_mpz const & euler();

    /* exponent of (Z/nZ)^* */
    cxx_mpz const & carmichael();

    prime_power_factorization const & carmichael_factorization();

    /* primes of carmichael(), with multiplicity, ascending */
    std::vector<cxx_mpz> carmichael_primes();

    bool is_cyclic();

    /* the units, ascending */
    std::vector<cxx_mpz> const & multiplicative_group();

    /* the smallest generator of (Z/nZ)^*, if the group is cyclic */
    std::optional<cxx_mpz> generator();

    /* the powers g^0, g^1, ..., g^(euler()-1) of generator(). Throws
     * not_cyclic */
    std::vector<cxx_mpz> const & cyclic_realization();

    /* x -> k such that g^k == x, for the generator g. Throws not_cyclic */
    std::map<cxx_mpz, cxx_mpz> const & discrete_log();

    /* multiplicative order. Throws not_invertible if the element is not
     * a unit. */
    cxx_mpz order_of(cxx_mpz const & element);

    /* the powers x^0, x^1, ... until we're back to 1. Throws
     * not_invertible if x is not a unit. */
    std::vector<cxx_mpz> cyclic_subgroup(cxx_mpz const & element);

    /* orders of all units */
    std::map<cxx_mpz, cxx_mpz> const & all_orders();

    /* ascending; empty if the group is not cyclic */
    std::vector<cxx_mpz> all_generators();

    /* ring operations. Results are in [0, n) */
    cxx_mpz elem(cxx_mpz const & x) const;
    cxx_mpz add(std::vector<cxx_mpz> const & elements) const;
    cxx_mpz mult(std::vector<cxx_mpz> const & elements) const;
    cxx_mpz power_of(cxx_mpz const & x, cxx_mpz const & e) const;
    cxx_mpz inverse_of(cxx_mpz const & x) const;

    /* only when the modulus is prime, see mod_sqrt */
    std::vector<cxx_mpz> sqrt_of(cxx_mpz const & x) const;
};

} /* namespace zmodn */

#endif	/* ZMODN_MODULAR_RING_HPP */
