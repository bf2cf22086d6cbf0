#pragma once

#include "cdm/util/contracts.hpp"
#include "fmt/format.h"
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace cdm {

struct invalid_option : std::logic_error
{
    using std::logic_error::logic_error;
};

// Checks whether an argument looks like an option, i.e. starts with `-` and
// isn't `-` alone.
inline auto is_opt(std::string_view arg) -> bool
{
    return arg.size() >= 2 && arg[0] == '-';
}

// Consumes the current argument if it is exactly `short_opt` or `long_opt`.
// Either spelling may be empty when the flag doesn't have one.
inline auto match_flag(char **&argv, std::string_view short_opt,
                       std::string_view long_opt) -> bool
{
    cdm_expects(argv != nullptr && *argv != nullptr);

    const std::string_view arg = *argv;

    if (!is_opt(arg))
        return false;

    if ((!short_opt.empty() && arg == short_opt) ||
        (!long_opt.empty() && arg == long_opt))
    {
        std::advance(argv, 1);
        return true;
    }

    return false;
}

// Consumes an option taking a value and returns the value.
//
// Accepted forms are `-oVALUE`, `-o VALUE`, `--opt=VALUE` and `--opt VALUE`.
// Returns `std::nullopt` without consuming anything if the current argument
// is neither option.
//
// \throws invalid_option if the value is missing or empty.
inline auto match_value(char **&argv, std::string_view short_opt,
                        std::string_view long_opt)
    -> std::optional<std::string_view>
{
    cdm_expects(argv != nullptr && *argv != nullptr);
    cdm_expects(short_opt.empty() || short_opt.size() == 2);
    cdm_expects(long_opt.empty() || long_opt.size() > 2);

    const std::string_view arg = *argv;
    std::string_view spelling;
    std::optional<std::string_view> value;

    if (!is_opt(arg))
        return std::nullopt;

    if (!short_opt.empty() && arg.substr(0, 2) == short_opt)
    {
        spelling = short_opt;
        if (arg.size() > 2)
            value = arg.substr(2);
    }
    else if (!long_opt.empty() && arg.substr(0, arg.find('=')) == long_opt)
    {
        spelling = long_opt;
        if (arg.size() > long_opt.size())
            value = arg.substr(long_opt.size() + 1);
    }
    else
    {
        return std::nullopt;
    }

    std::advance(argv, 1);

    if (!value)
    {
        if (*argv == nullptr)
            throw invalid_option(
                fmt::format("missing argument to `{}'", spelling));
        value = *argv;
        std::advance(argv, 1);
    }

    if (value->empty())
        throw invalid_option(fmt::format("empty argument to `{}'", spelling));

    return value;
}

} // namespace cdm
