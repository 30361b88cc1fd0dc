#ifndef TESTS_COMMON_H
#define TESTS_COMMON_H

#include <cstdint>
#include <gmp.h>

#define PARSE_SEED 1
#define PARSE_ITER 2
#define PARSE_VERBOSE 4
#define PARSE_QUIET 8

extern gmp_randstate_t state;

/** Generate a uniformly distributed random integer in the range 0 to
 *  2^N-1, inclusive. (Copied from GMP info page) */
void tests_common_urandomb (mpz_ptr R, mp_bitcnt_t N);
/** Generate a uniform random integer in the range 0 to N-1,
 *  inclusive. (Copied from GMP info page) */
void tests_common_urandomm (mpz_ptr R, mpz_srcptr N);
/** Generate a random integer with long strings of zeros and ones in
 *  the binary representation. (Copied from GMP info page) */
void tests_common_rrandomb (mpz_ptr R, mp_bitcnt_t N);
/** a random unsigned long in the range 0 to n-1 */
unsigned long tests_common_random_ulong(unsigned long n);
/** If the "-iter" command line parameter was parsed by tests_common_cmdline(),
 *  then write the iter value to *output, otherwise do nothing. */
void tests_common_get_iter(unsigned long *output);
/** If the "-v" command line parameter was parsed by tests_common_cmdline(),
 * then return non-zero, otherwise return zero. */
int tests_common_get_verbose();
/** If the "-q" command line parameter was parsed by tests_common_cmdline(),
 * then return non-zero, otherwise return zero. */
int tests_common_get_quiet();
void tests_common_cmdline(int *, const char ***, uint64_t);
void tests_common_clear();

#endif
