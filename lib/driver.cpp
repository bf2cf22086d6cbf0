#include "cdm/driver.hpp"
#include "cdm/type_widths.hpp"
#include "cdm/util/args.hpp"
#include "cdm/util/contracts.hpp"
#include "fmt/format.h"
#include <charconv>
#include <iterator>

namespace cdm {

auto parse_size_triple(std::string_view text) -> std::array<size_t, 3>
{
    std::array<size_t, 3> sizes{};
    const char *first = text.data();
    const char *const last = text.data() + text.size();

    for (size_t i = 0; i < sizes.size(); ++i)
    {
        if (i != 0)
        {
            if (first == last || *first != ',')
                throw invalid_option(
                    fmt::format("expected three sizes, got `{}'", text));
            ++first;
        }

        const auto [ptr, ec] = std::from_chars(first, last, sizes[i]);
        if (ec != std::errc())
            throw invalid_option(fmt::format("invalid size in `{}'", text));
        first = ptr;
    }

    if (first != last)
        throw invalid_option(
            fmt::format("expected three sizes, got `{}'", text));

    return sizes;
}

auto parse_options(int argc, char **argv) -> QueryOptions
{
    cdm_expects(argc >= 1);
    cdm_expects(argv[argc] == nullptr);

    QueryOptions opts;
    char **arg = std::next(argv);

    while (*arg != nullptr)
    {
        if (match_flag(arg, "-h", "--help"))
        {
            opts.show_help = true;
        }
        else if (match_flag(arg, "", "--table"))
        {
            opts.show_table = true;
        }
        else if (match_flag(arg, "", "--bits"))
        {
            opts.unit = Unit::Bits;
        }
        else if (auto model_name = match_value(arg, "-m", "--model"))
        {
            opts.model = parse_data_model(*model_name);
            if (!opts.model)
                throw invalid_option(
                    fmt::format("unknown data model `{}'", *model_name));
        }
        else if (auto type_name = match_value(arg, "-t", "--type"))
        {
            opts.category = parse_type_category(*type_name);
            if (!opts.category)
                throw invalid_option(
                    fmt::format("unknown type `{}'", *type_name));
        }
        else if (auto triple = match_value(arg, "-g", "--guess"))
        {
            opts.guess = parse_size_triple(*triple);
        }
        else
        {
            throw invalid_option(
                fmt::format("unrecognized option `{}'", *arg));
        }
    }

    if (opts.category && !opts.model && !opts.guess && !opts.show_help)
        throw invalid_option("`--type' requires `--model' or `--guess'");

    return opts;
}

auto run_query(const QueryOptions &opts) -> std::string
{
    if (opts.show_help)
        return std::string(usage());

    std::string out;
    auto it = std::back_inserter(out);
    std::optional<DataModel> model = opts.model;

    if (opts.guess)
    {
        const auto &[int_size, long_size, pointer_size] = *opts.guess;
        const DataModel guessed =
            data_model_from_sizes(int_size, long_size, pointer_size);
        fmt::format_to(it, "{}\n", guessed);
        if (!model)
            model = guessed;
    }

    if (model && opts.category)
    {
        const size_t entry = opts.unit == Unit::Bits
                                 ? width_of(*model, *opts.category)
                                 : size_of(*model, *opts.category);
        fmt::format_to(it, "{}\n", entry);
    }
    else if (model)
    {
        fmt::format_to(it, "{}\n{}\n", format_header(),
                       format_row(*model, opts.unit));
    }

    if (opts.show_table || (!model && !opts.guess))
        out += format_table(opts.unit);

    return out;
}

auto usage() -> std::string_view
{
    return "usage: cdm [options]\n"
           "\n"
           "Reports the sizes of the C integer types under a data model.\n"
           "\n"
           "options:\n"
           "  --table              print the whole size table (default)\n"
           "  --bits               report widths in bits instead of bytes\n"
           "  -m, --model NAME     print the sizes of data model NAME\n"
           "  -t, --type TYPE      print only TYPE (char, short, int, long,\n"
           "                       long long, pointer); needs --model or\n"
           "                       --guess\n"
           "  -g, --guess I,L,P    guess the data model from the sizes of\n"
           "                       int, long and pointer\n"
           "  -h, --help           print this message\n";
}

} // namespace cdm
