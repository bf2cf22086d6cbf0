#pragma once

#include "cdm/data_model.hpp"
#include <cstddef>

namespace cdm {

// Number of bits in a char. Every data model here assumes octets.
inline constexpr size_t char_bit = 8;

// TypeWidths - Bit widths of the C integer types under a data model.
//
// A width of zero means the type doesn't exist under that model.
struct TypeWidths
{
    size_t char_width = 0;
    size_t short_width = 0;
    size_t int_width = 0;
    size_t long_width = 0;
    size_t long_long_width = 0;
    size_t pointer_width = 0;

    TypeWidths() = default;

    auto operator==(const TypeWidths &) const -> bool = default;
};

// Returns the width in bits of `category` under `model`.
constexpr auto width_of(DataModel model, TypeCategory category) -> size_t
{
    return size_of(model, category) * char_bit;
}

// Returns the bit widths of every type category under `model`.
auto type_widths(DataModel model) -> TypeWidths;

} // namespace cdm
