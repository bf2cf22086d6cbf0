#pragma once

#include "cdm/data_model.hpp"
#include "cdm/table_format.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace cdm {

// QueryOptions - What the command-line driver was asked to report.
struct QueryOptions
{
    bool show_help = false; //< Print usage and exit.
    bool show_table = false; //< Print the whole size table.
    Unit unit = Unit::Bytes; //< Report bytes or bits.
    std::optional<DataModel> model; //< Model given by `--model`.
    std::optional<std::array<size_t, 3>> guess; //< (int, long, pointer) sizes.
    std::optional<TypeCategory> category; //< Single column given by `--type`.

    QueryOptions() = default;
};

// Parses a comma separated (int, long, pointer) size triple, e.g. "4,8,8".
//
// \throws invalid_option if there aren't exactly three decimal numbers.
auto parse_size_triple(std::string_view text) -> std::array<size_t, 3>;

// Parses the driver's command line. `argv` must be null terminated.
//
// \throws invalid_option on unknown options, missing or empty option values,
// unknown model or type names, malformed size triples, and `--type` given
// without `--model` or `--guess`.
auto parse_options(int argc, char **argv) -> QueryOptions;

// Runs a query and returns what should be printed to stdout.
auto run_query(const QueryOptions &opts) -> std::string;

// Returns the usage text.
auto usage() -> std::string_view;

} // namespace cdm
