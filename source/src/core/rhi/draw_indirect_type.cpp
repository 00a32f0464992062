#include "multidraw/core/rhi/draw_indirect_type.hpp"

#include <magic_enum/magic_enum.hpp>

namespace multidraw
{
    namespace rhi
    {
        std::string_view toString(const DrawIndirectType type) { return magic_enum::enum_name(type); }
    } // namespace rhi
} // namespace multidraw
