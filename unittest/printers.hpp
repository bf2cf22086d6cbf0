#pragma once

#include "cdm/data_model.hpp"
#include "cdm/type_widths.hpp"
#include "fmt/format.h"
#include <ostream>

namespace cdm {

inline void PrintTo(const DataModel model, std::ostream *os) noexcept
{
    *os << to_string(model);
}

inline void PrintTo(const TypeCategory category, std::ostream *os) noexcept
{
    *os << to_string(category);
}

inline void PrintTo(const TypeWidths &w, std::ostream *os)
{
    *os << fmt::format("TypeWidths{{{}, {}, {}, {}, {}, {}}}", w.char_width,
                       w.short_width, w.int_width, w.long_width,
                       w.long_long_width, w.pointer_width);
}

} // namespace cdm
