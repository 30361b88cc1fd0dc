#ifndef ZMODN_PARAMS_HPP
#define ZMODN_PARAMS_HPP

#include <cstdio>

#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "cxx_mpz.hpp"
#include "prime_power_factorization.hpp"

/* Values from the command line override values from a file, never the
 * other way around. */
enum parameter_origin { PARAMETER_FROM_FILE, PARAMETER_FROM_CMDLINE };

struct parameter_error : public std::runtime_error {
    explicit parameter_error(std::string const & arg)
        : std::runtime_error(arg)
    {}
};

/* A dictionary of key=value parameters, filled from the command line and
 * from parameter files, and queried with the param_list_* functions
 * below. Keys are compared with '-' and '_' considered equal.
 */
class cxx_param_list {
public:
    struct key_order {
        bool operator()(std::string const & a, std::string const & b) const;
    };

    struct entry {
        std::string value;
        parameter_origin origin = PARAMETER_FROM_FILE;
        bool looked_up = false;
        /* how many times the same value was given */
        int count = 1;
    };

    std::string usage_header;
    std::map<std::string, std::string, key_order> documentation;
    std::map<std::string, entry, key_order> entries;
    /* alias -> key */
    std::map<std::string, std::string, key_order> aliases;
    /* switches may be tied to a counter, or not */
    std::map<std::string, int *, key_order> switches;

    /* the first argv handed to param_list_update_cmdline, for
     * param_list_print_command_line */
    char const ** argv0 = nullptr;
    int argc0 = 0;

    cxx_param_list() = default;
    cxx_param_list(cxx_param_list const &) = delete;
    cxx_param_list & operator=(cxx_param_list const &) = delete;
};

extern void param_list_decl_usage(cxx_param_list & pl, const char * key,
        const char * doc);
extern void param_list_usage_header(cxx_param_list & pl, const char * hdr);
extern void param_list_print_usage(cxx_param_list const & pl,
        const char * argv0, FILE * f);

/* Reads "key = value" lines (also "key: value" and "key := value"), with
 * # comments. Returns 0 if some line could not be understood.
 */
extern int param_list_read(cxx_param_list & pl, std::istream & is);
/* Throws parameter_error if the file cannot be opened */
extern int param_list_read_file(cxx_param_list & pl, const char * name);

/* Consumes one option from (*p_argc, *p_argv): either -key value,
 * --key value, key=value, -key=value, or a configured switch (possibly
 * as --no-switch). Returns 0 and consumes nothing if the option is not
 * understood.
 */
extern int param_list_update_cmdline(cxx_param_list & pl,
        int * p_argc, char const *** p_argv);

/* Prints the usage, then throws parameter_error */
[[noreturn]] extern void param_list_generic_failure(cxx_param_list const & pl,
        const char * missing);

/* Returns 0 and leaves r alone if the key is absent, throws
 * parameter_error if the value does not parse as a T. */
template<typename T>
int param_list_parse(cxx_param_list & pl, std::string const & key, T & r);

/* A default constructed T if the key is absent */
template<typename T>
T param_list_parse(cxx_param_list & pl, std::string const & key)
{
    T r;
    param_list_parse<T>(pl, key, r);
    return r;
}

template<typename T>
T param_list_parse_mandatory(cxx_param_list & pl, std::string const & key)
{
    T r;
    if (!param_list_parse<T>(pl, key, r))
        param_list_generic_failure(pl, key.c_str());
    return r;
}

extern template int param_list_parse<bool>(cxx_param_list &, std::string const &, bool &);
extern template int param_list_parse<int>(cxx_param_list &, std::string const &, int &);
extern template int param_list_parse<unsigned long>(cxx_param_list &, std::string const &, unsigned long &);
extern template int param_list_parse<std::vector<int>>(cxx_param_list &, std::string const &, std::vector<int> &);
extern template int param_list_parse<cxx_mpz>(cxx_param_list &, std::string const &, cxx_mpz &);
extern template int param_list_parse<std::vector<cxx_mpz>>(cxx_param_list &, std::string const &, std::vector<cxx_mpz> &);
extern template int param_list_parse<zmodn::prime_power_factorization>(cxx_param_list &, std::string const &, zmodn::prime_power_factorization &);

/* Number of times the switch was given, 0 if never */
extern int param_list_parse_switch(cxx_param_list & pl, const char * key);

/* nullptr if the key is absent */
extern const char * param_list_lookup_string(cxx_param_list & pl, const char * key);

/* "-N 12" is then understood as "-modulus 12". Leading dashes are
 * ignored in both strings. */
extern void param_list_configure_alias(cxx_param_list & pl, const char * key,
        const char * alias);

/* A switch takes no value. Each occurrence increments *ptr, unless ptr
 * is null. */
extern void param_list_configure_switch(cxx_param_list & pl, const char * key,
        int * ptr);

/* Warns about the command-line parameters that nobody looked up, and
 * returns their number. Unused parameters from files are fine. */
extern int param_list_warn_unused(cxx_param_list const & pl);

extern void param_list_add_key(cxx_param_list & pl, const char * key,
        const char * value, parameter_origin origin);

extern void param_list_print_command_line(FILE * stream, cxx_param_list const & pl);

#endif	/* ZMODN_PARAMS_HPP */
