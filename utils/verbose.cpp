#include "zmodn.h" // IWYU pragma: keep

#include <cstdio>

#include <mutex>
#include <vector>

#include "fmt/format.h"

#include "verbose.hpp"
#include "params.hpp"
#include "macros.h"

namespace {
struct channel {
    FILE * f;
    int verbosity;
};

std::mutex io_mutex;
std::vector<channel> channels { { stdout, 1 }, { stderr, 1 } };
}

void verbose_decl_usage(cxx_param_list & pl)
{
    param_list_decl_usage(pl, "v", "increase verbosity (may be repeated)");
    param_list_configure_switch(pl, "-v", nullptr);
}

void verbose_interpret_parameters(cxx_param_list & pl)
{
    int const nv = param_list_parse_switch(pl, "-v");
    verbose_output_init(2);
    verbose_output_add(0, stdout, 1 + nv);
    verbose_output_add(1, stderr, 1);
}

void verbose_output_init(int nchannels)
{
    ASSERT_ALWAYS(nchannels >= 0);
    std::lock_guard<std::mutex> const dummy(io_mutex);
    channels.assign(nchannels, { nullptr, 0 });
}

void verbose_output_clear()
{
    verbose_output_init(0);
}

void verbose_output_add(int channel, FILE * f, int verbosity)
{
    std::lock_guard<std::mutex> const dummy(io_mutex);
    ASSERT_ALWAYS(channel >= 0 && (size_t) channel < channels.size());
    channels[channel] = { f, verbosity };
}

bool verbose_enabled(int channel, int verbosity)
{
    std::lock_guard<std::mutex> const dummy(io_mutex);
    if (channel < 0 || (size_t) channel >= channels.size())
        return false;
    auto const & c = channels[channel];
    return c.f != nullptr && c.verbosity >= verbosity;
}

void verbose_output_vfprint(int channel, int verbosity,
        fmt::string_view format, fmt::format_args args)
{
    std::lock_guard<std::mutex> const dummy(io_mutex);
    if (channel < 0 || (size_t) channel >= channels.size())
        return;
    auto const & c = channels[channel];
    if (c.f == nullptr || c.verbosity < verbosity)
        return;
    fmt::vprint(c.f, format, args);
}
