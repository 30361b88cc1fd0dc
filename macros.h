#ifndef ZMODN_MACROS_H
#define ZMODN_MACROS_H

#include <cassert>
#include <stdexcept>

/* Internal consistency checks. They catch bugs, not bad input: bad input
 * is reported with the exceptions of arithmetic_errors.hpp.
 */

#define ZMODN_STRINGIFY0(x) #x
#define ZMODN_STRINGIFY(x) ZMODN_STRINGIFY0(x)

// NOLINTBEGIN(readability-simplify-boolean-expr)
#define ASSERT_ALWAYS_OR_THROW(x, e)                                   \
    do {								\
        if (!(x)) 							\
            throw e("code BUG() : condition " #x                        \
                    " failed at " __FILE__ ":" ZMODN_STRINGIFY(__LINE__)); \
    } while (0)
#define ASSERT_ALWAYS(x) ASSERT_ALWAYS_OR_THROW(x, std::runtime_error)
// NOLINTEND(readability-simplify-boolean-expr)

/* Checks that cost as much as the computation they check, e.g.
 * recomputing a product. Define WANT_ASSERT_EXPENSIVE to enable them. */
#ifdef WANT_ASSERT_EXPENSIVE
#define ASSERT_EXPENSIVE(x) assert(x)
#else
#define ASSERT_EXPENSIVE(x)
#endif

#define LEXGE2(X,Y,A,B) ((X)>(A) || ((X) == (A) && (Y) >= (B)))
#define LEXGE3(X,Y,Z,A,B,C) ((X)>(A) || ((X) == (A) && LEXGE2((Y),(Z),(B),(C))))

#ifndef GNUC_VERSION_ATLEAST
#ifndef __GNUC__
#define GNUC_VERSION_ATLEAST(X,Y,Z) 0
#else
#define GNUC_VERSION_ATLEAST(X,Y,Z)     \
LEXGE3(__GNUC__,__GNUC_MINOR__,__GNUC_PATCHLEVEL__,(X),(Y),(Z))
#endif
#endif

#endif	/* ZMODN_MACROS_H */
