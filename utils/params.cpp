#include "zmodn.h" // IWYU pragma: keep

#include <cctype>
#include <cstdio>

#include <algorithm>
#include <fstream>
#include <istream>
#include <sstream>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

#include <gmp.h>
#include "fmt/format.h"

#include "params.hpp"
#include "cxx_mpz.hpp"
#include "prime_power_factorization.hpp"
#include "macros.h"

/* '-' and '_' are the same, except as a first character, so that
 * -trial-division-bound and -trial_division_bound are one key. */
bool cxx_param_list::key_order::operator()(std::string const & a, std::string const & b) const
{
    auto fold = [](char c, size_t k) { return (k && c == '_') ? '-' : c; };
    size_t const n = std::min(a.size(), b.size());
    for(size_t k = 0 ; k < n ; k++) {
        char const ca = fold(a[k], k);
        char const cb = fold(b[k], k);
        if (ca != cb)
            return ca < cb;
    }
    return a.size() < b.size();
}

static const char * skip_dashes(const char * s)
{
    for(int i = 0 ; i < 2 && *s == '-' ; i++, s++) ;
    return s;
}

void param_list_decl_usage(cxx_param_list & pl, const char * key, const char * doc)
{
    pl.documentation[skip_dashes(key)] = doc;
}

void param_list_usage_header(cxx_param_list & pl, const char * hdr)
{
    pl.usage_header = hdr;
}

void param_list_print_usage(cxx_param_list const & pl, const char * argv0, FILE * f)
{
    if (argv0)
        fmt::print(f, "Usage: {} <parameters>\n", argv0);
    fmt::print(f, "{}", pl.usage_header);
    fmt::print(f, "The available parameters are the following:\n");

    auto doc = pl.documentation;
    for(auto const & s : pl.switches)
        doc[s.first] = fmt::format("(switch) {}", doc[s.first]);
    for(auto const & [ alias, key ] : pl.aliases)
        doc[key] = fmt::format("(alias -{}) {}", alias, doc[key]);
    for(auto const & [ key, text ] : doc)
        fmt::print(f, "    -{:<20} {}\n", key, text);
}

void param_list_add_key(cxx_param_list & pl, const char * key,
        const char * value, parameter_origin origin)
{
    ASSERT_ALWAYS(key != nullptr);
    ASSERT_ALWAYS(value != nullptr);

    auto it = pl.entries.find(key);
    if (it != pl.entries.end()) {
        cxx_param_list::entry & e = it->second;
        if (e.origin > origin)
            return;
        if (e.origin == origin && e.value == value) {
            e.count++;
            return;
        }
    }
    cxx_param_list::entry & e = pl.entries[key];
    e = cxx_param_list::entry { value, origin };
    /* nobody will look a switch up by value */
    e.looked_up = pl.switches.count(key) != 0;
}

static std::string trim(std::string const & s)
{
    auto const b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return std::string();
    auto const e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e + 1 - b);
}

int param_list_read(cxx_param_list & pl, std::istream & is)
{
    int ok = 1;
    for(std::string line ; std::getline(is, line) ; ) {
        std::string const s = trim(line.substr(0, line.find('#')));
        if (s.empty())
            continue;

        size_t l = 0;
        for( ; l < s.size() ; l++) {
            unsigned char const c = s[l];
            if (!std::isalnum(c) && c != '_' && c != '-')
                break;
        }

        /* key, then one of = : := */
        size_t q = s.find_first_not_of(" \t", l);
        if (l > 0 && q != std::string::npos && s.compare(q, 2, ":=") == 0)
            q += 2;
        else if (l > 0 && q != std::string::npos && (s[q] == '=' || s[q] == ':'))
            q += 1;
        else {
            fmt::print(stderr, "Parse error in parameter line:\n{}\n", s);
            ok = 0;
            continue;
        }

        param_list_add_key(pl, s.substr(0, l).c_str(),
                trim(s.substr(q)).c_str(), PARAMETER_FROM_FILE);
    }
    return ok;
}

int param_list_read_file(cxx_param_list & pl, const char * name)
{
    std::ifstream f(name);
    if (!f)
        throw parameter_error(fmt::format("Cannot read {}", name));
    return param_list_read(pl, f);
}

void param_list_configure_alias(cxx_param_list & pl, const char * key, const char * alias)
{
    ASSERT_ALWAYS(key != nullptr);
    ASSERT_ALWAYS(alias != nullptr);
    pl.aliases[skip_dashes(alias)] = skip_dashes(key);
}

void param_list_configure_switch(cxx_param_list & pl, const char * key, int * ptr)
{
    pl.switches[skip_dashes(key)] = ptr;
}

int param_list_update_cmdline(cxx_param_list & pl,
        int * p_argc, char const *** p_argv)
{
    ASSERT_ALWAYS(*p_argv != nullptr);
    if (!pl.argv0) {
        pl.argv0 = *p_argv - 1;
        pl.argc0 = *p_argc + 1;
    }
    if (*p_argc == 0)
        return 0;

    const char * arg = (*p_argv)[0];
    /* "--" ends the options, the caller sees it */
    if (std::string(arg) == "--")
        return 0;

    const char * bare = skip_dashes(arg);
    bool const dashed = bare != arg;

    std::string key = bare;
    std::string value;
    bool has_value = false;
    if (auto const eq = key.find('=') ; eq != std::string::npos) {
        value = key.substr(eq + 1);
        key.erase(eq);
        has_value = true;
    }

    bool negated = false;
    if (dashed && !has_value && (key.starts_with("no-") || key.starts_with("no_"))) {
        std::string const k = key.substr(3);
        if (pl.switches.count(k) || pl.aliases.count(k)) {
            key = k;
            negated = true;
        }
    }

    if (auto it = pl.aliases.find(key) ; it != pl.aliases.end())
        key = it->second;

    if (auto it = pl.switches.find(key) ; it != pl.switches.end()) {
        if (has_value)
            return 0;
        if (it->second)
            *it->second = negated ? 0 : *it->second + 1;
        param_list_add_key(pl, key.c_str(), "", PARAMETER_FROM_CMDLINE);
        (*p_argv)++, (*p_argc)--;
        return 1;
    }
    if (negated || key.empty())
        return 0;

    /* only -key and --key take their value from the next argument */
    int used = 1;
    if (!has_value) {
        if (!dashed || *p_argc < 2)
            return 0;
        value = (*p_argv)[1];
        used = 2;
    }

    param_list_add_key(pl, key.c_str(), value.c_str(), PARAMETER_FROM_CMDLINE);
    (*p_argv) += used;
    (*p_argc) -= used;
    return 1;
}

/* marks the entry as used */
static cxx_param_list::entry const * lookup(cxx_param_list & pl, const char * key)
{
    std::string const k = skip_dashes(key);
    if (!pl.documentation.empty() && !pl.documentation.count(k))
        fmt::print(stderr, "# Warning: parameter {} is looked up but undocumented\n", k);
    auto it = pl.entries.find(k);
    if (it == pl.entries.end())
        return nullptr;
    it->second.looked_up = true;
    return &it->second;
}

/* The whole string must be consumed. Parsers either return false or
 * throw parameter_error with a more precise message. */
template<typename T> struct parse {
    bool operator()(std::string const & s, T & value) const
    {
        std::istringstream ss(s);
        return ss >> value && ss.eof();
    }
};

template<typename T>
static bool parse_list(std::string const & s, std::vector<T> & value, char sep)
{
    value.clear();
    std::istringstream ss(s);
    for(std::string token ; std::getline(ss, token, sep) ; ) {
        T v;
        if (!parse<T>()(token, v))
            return false;
        value.push_back(std::move(v));
    }
    return true;
}

template<typename T> struct parse<std::vector<T>> {
    bool operator()(std::string const & s, std::vector<T> & value) const
    {
        return parse_list(s, value, ',');
    }
};

static bool parse_mpz_nothrow(std::string const & s, cxx_mpz & value)
{
    int nread = 0;
    int const rc = gmp_sscanf(s.c_str(), "%Zi%n", (mpz_ptr) value, &nread);
    return rc == 1 && (size_t) nread == s.size();
}

template<> struct parse<cxx_mpz> {
    bool operator()(std::string const & s, cxx_mpz & value) const
    {
        if (!parse_mpz_nothrow(s, value))
            throw parameter_error(fmt::format("{} is not an integer", s));
        return true;
    }
};

template<> struct parse<bool> {
    bool operator()(std::string const & s, bool & value) const
    {
        int i;
        if (parse<int>()(s, i))
            value = i != 0;
        else if (s == "true" || s == "True" || s == "yes" || s == "on")
            value = true;
        else if (s == "false" || s == "False" || s == "no" || s == "off")
            value = false;
        else
            return false;
        return true;
    }
};

/* p or p^e, with p > 1 and e > 0 */
template<> struct parse<zmodn::prime_power> {
    bool operator()(std::string const & s, zmodn::prime_power & value) const
    {
        auto const caret = s.find('^');
        value.second = 1;
        if (caret != std::string::npos) {
            if (!parse<int>()(s.substr(caret + 1), value.second) || value.second <= 0)
                return false;
        }
        /* must not throw, the caller tries several separators */
        return parse_mpz_nothrow(s.substr(0, caret), value.first) && value.first > 1;
    }
};

/* 2^3*5, or 2^3,5 which is friendlier to the shell. 1 is the empty
 * factorization. */
template<> struct parse<zmodn::prime_power_factorization> {
    bool operator()(std::string const & s, zmodn::prime_power_factorization & value) const
    {
        value.clear();
        if (s == "1")
            return true;
        std::vector<zmodn::prime_power> tmp;
        if (!parse_list(s, tmp, '*') && !parse_list(s, tmp, ','))
            return false;
        for(auto const & [ p, e ] : tmp)
            value[p] += e;
        return true;
    }
};

template<typename T>
int param_list_parse(cxx_param_list & pl, std::string const & key, T & r)
{
    auto const * e = lookup(pl, key.c_str());
    if (!e)
        return 0;
    std::string why;
    try {
        if (parse<T>()(e->value, r))
            return 1;
    } catch (parameter_error const & x) {
        why = fmt::format(": {}", x.what());
    }
    throw parameter_error(fmt::format("cannot cast parameter {}={} to type {}{}",
                key, e->value, typeid(T).name(), why));
}

template int param_list_parse<bool>(cxx_param_list &, std::string const &, bool &);
template int param_list_parse<int>(cxx_param_list &, std::string const &, int &);
template int param_list_parse<unsigned long>(cxx_param_list &, std::string const &, unsigned long &);
template int param_list_parse<std::vector<int>>(cxx_param_list &, std::string const &, std::vector<int> &);
template int param_list_parse<cxx_mpz>(cxx_param_list &, std::string const &, cxx_mpz &);
template int param_list_parse<std::vector<cxx_mpz>>(cxx_param_list &, std::string const &, std::vector<cxx_mpz> &);
template int param_list_parse<zmodn::prime_power_factorization>(cxx_param_list &, std::string const &, zmodn::prime_power_factorization &);

const char * param_list_lookup_string(cxx_param_list & pl, const char * key)
{
    auto const * e = lookup(pl, key);
    return e ? e->value.c_str() : nullptr;
}

int param_list_parse_switch(cxx_param_list & pl, const char * key)
{
    auto const * e = lookup(pl, key);
    if (!e)
        return 0;
    if (!e->value.empty())
        throw parameter_error(fmt::format("option {} takes no value", key));
    return e->count;
}

int param_list_warn_unused(cxx_param_list const & pl)
{
    int n = 0;
    for(auto const & [ key, e ] : pl.entries) {
        if (e.origin == PARAMETER_FROM_CMDLINE && !e.looked_up) {
            fmt::print(stderr, "Warning: unused command-line parameter {}\n", key);
            n++;
        }
    }
    return n;
}

void param_list_print_command_line(FILE * stream, cxx_param_list const & pl)
{
    if (!pl.argv0)
        return;
    fmt::print(stream, "# (zmodn {}) {}", ZMODN_VERSION_STRING, pl.argv0[0]);
    for(int i = 1 ; i < pl.argc0 ; i++)
        fmt::print(stream, " {}", pl.argv0[i]);
    fmt::print(stream, "\n");
}

void param_list_generic_failure(cxx_param_list const & pl, const char * missing)
{
    param_list_print_usage(pl, pl.argv0 ? pl.argv0[0] : nullptr, stderr);
    throw parameter_error(fmt::format("missing or invalid parameter \"-{}\"",
                missing ? missing : ""));
}
