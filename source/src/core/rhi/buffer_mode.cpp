#include "multidraw/core/rhi/buffer_mode.hpp"

#include <magic_enum/magic_enum.hpp>

namespace multidraw
{
    namespace rhi
    {
        std::string_view toString(const BufferMode bufferMode) { return magic_enum::enum_name(bufferMode); }
    } // namespace rhi
} // namespace multidraw
