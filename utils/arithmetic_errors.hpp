#ifndef ZMODN_ARITHMETIC_ERRORS_HPP
#define ZMODN_ARITHMETIC_ERRORS_HPP

#include <stdexcept>
#include <string>

#include "fmt/format.h"

#include "cxx_mpz.hpp"

namespace zmodn {

/* All precondition violations of the arithmetic code derive from this
 * one. None of them is caught within the library.
 */
struct arithmetic_error : public std::runtime_error {
    explicit arithmetic_error(std::string const & what)
        : std::runtime_error(what)
    {}
};

struct division_by_zero : public arithmetic_error {
    explicit division_by_zero(cxx_mpz const & num)
        : arithmetic_error(fmt::format("attempted division of {} by zero", num))
    {}
};

struct undefined_gcd : public arithmetic_error {
    undefined_gcd()
        : arithmetic_error("gcd(0, 0) is undefined")
    {}
};

struct undefined_lcm : public arithmetic_error {
    undefined_lcm(cxx_mpz const & a, cxx_mpz const & b)
        : arithmetic_error(fmt::format("lcm({}, {}) is undefined", a, b))
    {}
};

struct not_invertible : public arithmetic_error {
    not_invertible(cxx_mpz const & num, cxx_mpz const & mod)
        : arithmetic_error(fmt::format("{} is not invertible modulo {}", num, mod))
    {}
};

struct invalid_modulus : public arithmetic_error {
    explicit invalid_modulus(cxx_mpz const & mod)
        : arithmetic_error(fmt::format("modulus must be at least 2, got {}", mod))
    {}
    invalid_modulus(cxx_mpz const & mod, const char * requirement)
        : arithmetic_error(fmt::format("modulus {} must be {}", mod, requirement))
    {}
};

struct invalid_base : public arithmetic_error {
    explicit invalid_base(cxx_mpz const & base)
        : arithmetic_error(fmt::format("p-adic base must be at least 2, got {}", base))
    {}
};

struct undefined_valuation : public arithmetic_error {
    explicit undefined_valuation(cxx_mpz const & base)
        : arithmetic_error(fmt::format("the {}-adic valuation of 0 is undefined", base))
    {}
};

struct undefined_jacobi_symbol : public arithmetic_error {
    undefined_jacobi_symbol(cxx_mpz const & a, cxx_mpz const & b)
        : arithmetic_error(fmt::format("Jacobi symbol ( {} | {} ) is undefined", a, b))
    {}
};

struct undefined_factorization : public arithmetic_error {
    undefined_factorization()
        : arithmetic_error("0 has no prime factorization")
    {}
};

struct invalid_factorization : public arithmetic_error {
    explicit invalid_factorization(std::string const & what)
        : arithmetic_error(what)
    {}
};

struct not_cyclic : public arithmetic_error {
    explicit not_cyclic(cxx_mpz const & mod)
        : arithmetic_error(fmt::format("the multiplicative group modulo {} is not cyclic", mod))
    {}
};

} /* namespace zmodn */

#endif	/* ZMODN_ARITHMETIC_ERRORS_HPP */
