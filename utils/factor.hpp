#ifndef ZMODN_FACTOR_HPP
#define ZMODN_FACTOR_HPP

#include <list>

#include "cxx_mpz.hpp"
#include "prime_power_factorization.hpp"

namespace zmodn {

/*
 * Fully factors the absolute value of an integer. Small factors are
 * found by trial division, the rest is split with Pollard's rho
 * (Brent's variant), which is fine for the sizes that make sense in a
 * modular_ring.
 */
class integer_factorizer {
    cxx_mpz N; /* input integer that we want to factor */
    unsigned long B = 0; /* all primes < B have been trial divided */
    cxx_mpz BB; /* square of the trial division bound */

    prime_power_factorization primes;

    /* Invariant: primes.value() * cofactor == |N| */
    cxx_mpz cofactor;

    /* composites dividing cofactor. They need not be coprime, and they
     * may still contain primes that were found in the meantime, which
     * tidy() strips.
     */
    std::list<cxx_mpz> composites;

    void print_progress(const char * header) const;

    /* Assumes n has no prime factor < B. So if n is smaller than B^2, it is
     * necessarily a prime.
     */
    bool isprime(cxx_mpz const & n) const;

    /* write n as r^e, with e >= 1 as large as possible.
     * r and n cannot be a ref to the same variable.
     */
    static void write_as_power(cxx_mpz & r, int & e, cxx_mpz const & n);

    /* p must be a prime dividing cofactor, and must not be known yet */
    void push_prime(cxx_mpz const & p);

    /* strip known primes from the composites, drop the ones that became
     * 1, and move prime powers to the list of primes */
    void tidy();

    /* returns a divisor of n, which is n itself if this polynomial
     * constant does not work */
    static cxx_mpz pollard_brent_rho(cxx_mpz const & n, unsigned long c);

public:
    int isprime_niter = 25; /* number of iterations for primality testing */

    static constexpr unsigned long default_trialdiv_bound = 1UL << 12;

    /* Throws undefined_factorization if n is zero */
    explicit integer_factorizer(cxx_mpz n);

    /* trial division for all primes p < bound */
    void trial_division_up_to(unsigned long bound);

    /* split all remaining composites with rho */
    void do_rho();

    void factor_using_default_strategy(unsigned long trialdiv_bound = default_trialdiv_bound)
    {
        trial_division_up_to(trialdiv_bound);
        if (!is_complete())
            do_rho();
    }

    prime_power_factorization const & prime_factors() const
    {
        return primes;
    }

    bool is_complete() const
    {
        return cofactor == 1;
    }
};

/* factorization of |n|, empty for |n| == 1. Throws
 * undefined_factorization for n == 0. */
prime_power_factorization factor(cxx_mpz const & n);

} /* namespace zmodn */

#endif	/* ZMODN_FACTOR_HPP */
