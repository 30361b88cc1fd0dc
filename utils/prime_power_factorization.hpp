#ifndef ZMODN_PRIME_POWER_FACTORIZATION_HPP
#define ZMODN_PRIME_POWER_FACTORIZATION_HPP

#include <map>
#include <ostream>
#include <utility>
#include <vector>

#include "fmt/format.h"
#include "fmt/ostream.h"

#include "cxx_mpz.hpp"

namespace zmodn {

struct prime_power : public std::pair<cxx_mpz, int> {};

/* prime -> exponent, all exponents positive. The empty factorization is
 * the one of 1.
 */
struct prime_power_factorization : public std::map<cxx_mpz, int> {
    cxx_mpz value() const;

    /* each prime repeated as many times as its exponent, ascending */
    std::vector<cxx_mpz> primes_with_multiplicity() const;
};

std::ostream & operator<<(std::ostream & os, prime_power_factorization const & F);

} /* namespace zmodn */

namespace fmt {
    template <> struct formatter<zmodn::prime_power_factorization>: ostream_formatter {};
}

#endif	/* ZMODN_PRIME_POWER_FACTORIZATION_HPP */
