#ifndef ZMODN_VERBOSE_HPP
#define ZMODN_VERBOSE_HPP

#include <cstdio>

#include "fmt/format.h"

#include "params.hpp"

/* Output channels. Each channel goes to one FILE, and a message sent to
 * a channel with verbosity level v is printed only if the verbosity of
 * the channel is at least v.
 *
 * By default, channel 0 is stdout and channel 1 is stderr, both with
 * verbosity 1.
 */

extern void verbose_decl_usage(cxx_param_list & pl);
/* sets up the default channels, with the verbosity of channel 0
 * increased by the number of -v switches. */
extern void verbose_interpret_parameters(cxx_param_list & pl);

extern void verbose_output_init(int nchannels);
extern void verbose_output_clear();
extern void verbose_output_add(int channel, FILE * f, int verbosity);

extern bool verbose_enabled(int channel, int verbosity);

extern void verbose_output_vfprint(int channel, int verbosity,
        fmt::string_view format, fmt::format_args args);

template <typename... T>
void verbose_fmt_print(int channel, int verbosity,
        fmt::format_string<T...> format, T&&... args)
{
    if (!verbose_enabled(channel, verbosity))
        return;
    verbose_output_vfprint(channel, verbosity, format,
            fmt::make_format_args(args...));
}

#endif	/* ZMODN_VERBOSE_HPP */
