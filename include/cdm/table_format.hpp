#pragma once

#include "cdm/data_model.hpp"
#include "fmt/format.h"
#include <string>
#include <string_view>

namespace cdm {

// Unit in which table entries are reported.
enum class Unit
{
    Bytes,
    Bits,
};

// Returns the header line of the size table, without a trailing newline.
auto format_header() -> std::string;

// Returns `model`'s line of the size table, without a trailing newline.
//
// Columns line up with `format_header()`. Types the model doesn't have are
// shown as "-".
auto format_row(DataModel model, Unit unit = Unit::Bytes) -> std::string;

// Returns the header followed by a line per data model, in declaration order.
// Every line ends with a newline.
auto format_table(Unit unit = Unit::Bytes) -> std::string;

} // namespace cdm

template <>
struct fmt::formatter<cdm::DataModel> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(cdm::DataModel model, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(cdm::to_string(model),
                                                        ctx);
    }
};

template <>
struct fmt::formatter<cdm::TypeCategory> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(cdm::TypeCategory category, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(
            cdm::to_string(category), ctx);
    }
};
