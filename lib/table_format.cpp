#include "cdm/table_format.hpp"
#include "cdm/type_widths.hpp"
#include <iterator>

namespace cdm {

namespace {

// Width of the model name column.
constexpr size_t name_column_width = 8;

auto entry_of(DataModel model, TypeCategory category, Unit unit) -> size_t
{
    switch (unit)
    {
        case Unit::Bytes: return size_of(model, category);
        case Unit::Bits: return width_of(model, category);
    }

    cdm_unreachable();
}

} // namespace

auto format_header() -> std::string
{
    std::string header = fmt::format("{:<{}}", "model", name_column_width);
    for (const TypeCategory category : all_type_categories)
        fmt::format_to(std::back_inserter(header), " {}", category);
    return header;
}

auto format_row(DataModel model, Unit unit) -> std::string
{
    std::string row = fmt::format("{:<{}}", model, name_column_width);

    for (const TypeCategory category : all_type_categories)
    {
        const size_t column_width = to_string(category).size();
        const size_t entry = entry_of(model, category, unit);

        if (entry == 0)
            fmt::format_to(std::back_inserter(row), " {:>{}}", "-",
                           column_width);
        else
            fmt::format_to(std::back_inserter(row), " {:>{}}", entry,
                           column_width);
    }

    return row;
}

auto format_table(Unit unit) -> std::string
{
    std::string table = format_header();
    table += '\n';

    for (const DataModel model : all_data_models)
    {
        table += format_row(model, unit);
        table += '\n';
    }

    return table;
}

} // namespace cdm
