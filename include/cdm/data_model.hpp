#pragma once

#include "cdm/util/contracts.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace cdm {

/// A data model is the choice of widths for the C integer types made by a
/// platform or vendor.
///
/// The C standard only fixes minimum ranges for `char`, `short`, `int`, `long`
/// and `long long`, so every ABI picks concrete sizes. Model names spell out
/// which types are wide: ILP32 means (I)nt, (L)ong and (P)ointer are 32 bits.
/// The naming isn't entirely consistent across the literature.
///
/// Four models found wide acceptance: LP32 (Win16, m68k Mac), ILP32 (Win32,
/// 32-bit Unix), LLP64 (Win64) and LP64 (64-bit Unix).
///
/// References:
///   J. R. Mashey. The long road to 64 bits. ACM Queue, 4(8):24-35, 2006.
///   T. Lauer. Porting to Win32. Springer, 1996.
enum class DataModel : uint8_t
{
    //       char, short, int, long, long long, pointer (bits)
    IP16,    //   8,    --,  16,   --,        --,      16
    IP16L32, //   8,    16,  16,   32,        --,      16
    LP32,    //   8,    16,  16,   32,        64,      32
    ILP32,   //   8,    16,  32,   32,        64,      32
    LLP64,   //   8,    16,  32,   32,        64,      64
    LP64,    //   8,    16,  32,   64,        64,      64
    ILP64,   //   8,    16,  64,   64,        64,      64
    SILP64,  //   8,    64,  64,   64,        64,      64
    Unknown, ///< Sentinel for a model that couldn't be determined.
};

/// The C types whose size a data model fixes.
enum class TypeCategory : uint8_t
{
    Char, ///< Smallest addressable unit, CHAR_BIT bits wide.
    Short, ///< At least 16 bits.
    Int, ///< At least 16 bits.
    Long, ///< At least 32 bits.
    LongLong, ///< At least 64 bits.
    Pointer, ///< Object pointers and `size_t`, at least 16 bits.
};

inline constexpr size_t num_data_models = 9;
inline constexpr size_t num_type_categories = 6;

/// Every data model, in declaration order.
inline constexpr std::array<DataModel, num_data_models> all_data_models = {
    DataModel::IP16,  DataModel::IP16L32, DataModel::LP32,
    DataModel::ILP32, DataModel::LLP64,   DataModel::LP64,
    DataModel::ILP64, DataModel::SILP64,  DataModel::Unknown,
};

/// Every type category, in the conventional promotion order.
inline constexpr std::array<TypeCategory, num_type_categories>
    all_type_categories = {
        TypeCategory::Char,     TypeCategory::Short,   TypeCategory::Int,
        TypeCategory::Long,     TypeCategory::LongLong, TypeCategory::Pointer,
};

namespace detail {
// Sizes in bytes. Zero stands for a type the model doesn't have, or
// doesn't specify.
inline constexpr uint8_t size_table[num_data_models][num_type_categories] = {
    // char, short, int, long, long long, pointer
    {1, 0, 2, 0, 0, 2}, // IP16
    {1, 2, 2, 4, 0, 2}, // IP16L32
    {1, 2, 2, 4, 8, 4}, // LP32
    {1, 2, 4, 4, 8, 4}, // ILP32
    {1, 2, 4, 4, 8, 8}, // LLP64
    {1, 2, 4, 8, 8, 8}, // LP64
    {1, 2, 8, 8, 8, 8}, // ILP64
    {1, 8, 8, 8, 8, 8}, // SILP64
    {0, 0, 0, 0, 0, 0}, // Unknown
};
} // namespace detail

/// Returns the size in bytes of `category` under `model`.
///
/// Every pair has an answer. A result of zero means the model is `Unknown`,
/// or the type doesn't exist under that model (e.g. `long` on IP16).
constexpr auto size_of(DataModel model, TypeCategory category) -> size_t
{
    const auto row = static_cast<size_t>(model);
    const auto col = static_cast<size_t>(category);
    cdm_expects(row < num_data_models && col < num_type_categories);
    return detail::size_table[row][col];
}

/// Compile-time column selection, e.g. `size_of<TypeCategory::Pointer>(m)`.
template <TypeCategory Category>
constexpr auto size_of(DataModel model) -> size_t
{
    return size_of(model, Category);
}

/// Guesses the data model from the sizes in bytes of `int`, `long` and a
/// pointer.
///
/// Only exact matches are recognized, anything else yields
/// `DataModel::Unknown`. SILP64 is never returned: its (int, long, pointer)
/// triple is the same as ILP64's, and the two differ only in `short`.
constexpr auto data_model_from_sizes(size_t int_size, size_t long_size,
                                     size_t pointer_size) -> DataModel
{
    if (int_size == 2 && long_size == 0 && pointer_size == 2)
        return DataModel::IP16;
    if (int_size == 2 && long_size == 4 && pointer_size == 2)
        return DataModel::IP16L32;
    if (int_size == 2 && long_size == 4 && pointer_size == 4)
        return DataModel::LP32;
    if (int_size == 4 && long_size == 4 && pointer_size == 4)
        return DataModel::ILP32;
    if (int_size == 4 && long_size == 4 && pointer_size == 8)
        return DataModel::LLP64;
    if (int_size == 4 && long_size == 8 && pointer_size == 8)
        return DataModel::LP64;
    if (int_size == 8 && long_size == 8 && pointer_size == 8)
        return DataModel::ILP64;
    return DataModel::Unknown;
}

// Returns the conventional name of a data model, e.g. "LP64".
auto to_string(DataModel) -> std::string_view;

// Returns the C spelling of a type category, e.g. "long long".
auto to_string(TypeCategory) -> std::string_view;

// Returns the platforms a data model is known from, e.g. "Win64" for LLP64.
auto description(DataModel) -> std::string_view;

/// Parses a data model name, ignoring case. "Unknown" parses as
/// `DataModel::Unknown`; names that aren't a model yield `std::nullopt`.
auto parse_data_model(std::string_view name) -> std::optional<DataModel>;

/// Parses a type category from either its C spelling ("long long"), its
/// enumerator name ("LongLong") or "size_t", which is an alias of pointer.
auto parse_type_category(std::string_view name) -> std::optional<TypeCategory>;

static_assert(size_of<TypeCategory::Pointer>(DataModel::LP64) == 8);
static_assert(size_of<TypeCategory::Long>(DataModel::LLP64) == 4);
static_assert(data_model_from_sizes(8, 8, 8) == DataModel::ILP64);

} // namespace cdm
