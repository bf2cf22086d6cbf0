#include "cdm/data_model.hpp"
#include <algorithm>
#include <cctype>

namespace cdm {

namespace {

auto equals_insensitive(std::string_view lhs, std::string_view rhs) -> bool
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                      });
}

} // namespace

auto to_string(DataModel model) -> std::string_view
{
    switch (model)
    {
        case DataModel::IP16: return "IP16";
        case DataModel::IP16L32: return "IP16L32";
        case DataModel::LP32: return "LP32";
        case DataModel::ILP32: return "ILP32";
        case DataModel::LLP64: return "LLP64";
        case DataModel::LP64: return "LP64";
        case DataModel::ILP64: return "ILP64";
        case DataModel::SILP64: return "SILP64";
        case DataModel::Unknown: return "Unknown";
    }

    cdm_unreachable();
}

auto to_string(TypeCategory category) -> std::string_view
{
    switch (category)
    {
        case TypeCategory::Char: return "char";
        case TypeCategory::Short: return "short";
        case TypeCategory::Int: return "int";
        case TypeCategory::Long: return "long";
        case TypeCategory::LongLong: return "long long";
        case TypeCategory::Pointer: return "pointer";
    }

    cdm_unreachable();
}

auto description(DataModel model) -> std::string_view
{
    switch (model)
    {
        case DataModel::IP16: return "16-bit PDP-11";
        case DataModel::IP16L32: return "32-bit PDP-11";
        case DataModel::LP32: return "m68k Mac, Win16";
        case DataModel::ILP32: return "Unix before the mid-1990s, Win32";
        case DataModel::LLP64: return "Win64";
        case DataModel::LP64: return "Unix/Linux after the 1990s";
        case DataModel::ILP64: return "HAL/Fujitsu SPARC64";
        case DataModel::SILP64: return "Cray UNICOS";
        case DataModel::Unknown: return "unknown data model";
    }

    cdm_unreachable();
}

auto parse_data_model(std::string_view name) -> std::optional<DataModel>
{
    for (const DataModel model : all_data_models)
    {
        if (equals_insensitive(name, to_string(model)))
            return model;
    }

    return std::nullopt;
}

auto parse_type_category(std::string_view name) -> std::optional<TypeCategory>
{
    if (name == "size_t")
        return TypeCategory::Pointer;

    // "long long" is the only spelling that differs from the enumerator.
    if (equals_insensitive(name, "longlong"))
        return TypeCategory::LongLong;

    for (const TypeCategory category : all_type_categories)
    {
        if (equals_insensitive(name, to_string(category)))
            return category;
    }

    return std::nullopt;
}

} // namespace cdm
