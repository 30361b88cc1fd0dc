#ifndef ZMODN_H
#define ZMODN_H

/* This header must be included first by every compilation unit of the
 * project, before any system header.
 */

#include "zmodn_config.h"       // IWYU pragma: export

/* we rely on mpz_{set,get,cmp}_{si,ui} being able to carry 64-bit
 * integers */
#ifdef __cplusplus
#include <climits>
static_assert(sizeof(long) * CHAR_BIT >= 64,
        "zmodn needs a platform where long is at least 64 bits wide");
#endif

#endif	/* ZMODN_H */
