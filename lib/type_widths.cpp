#include "cdm/type_widths.hpp"

namespace cdm {

auto type_widths(DataModel model) -> TypeWidths
{
    TypeWidths widths;
    widths.char_width = width_of(model, TypeCategory::Char);
    widths.short_width = width_of(model, TypeCategory::Short);
    widths.int_width = width_of(model, TypeCategory::Int);
    widths.long_width = width_of(model, TypeCategory::Long);
    widths.long_long_width = width_of(model, TypeCategory::LongLong);
    widths.pointer_width = width_of(model, TypeCategory::Pointer);
    return widths;
}

} // namespace cdm
