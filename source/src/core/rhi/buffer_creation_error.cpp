#include "multidraw/core/rhi/buffer_creation_error.hpp"

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>

namespace multidraw
{
    namespace rhi
    {
        std::string BufferCreationError::toString() const
        {
            return message.empty() ? std::string {magic_enum::enum_name(kind)} :
                                     fmt::format("{}: {}", magic_enum::enum_name(kind), message);
        }
    } // namespace rhi
} // namespace multidraw
