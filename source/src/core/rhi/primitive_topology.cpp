#include "multidraw/core/rhi/primitive_topology.hpp"

#include <magic_enum/magic_enum.hpp>

namespace multidraw
{
    namespace rhi
    {
        // Enumerators share their values with VkPrimitiveTopology.
        vk::PrimitiveTopology toVk(const PrimitiveTopology primitiveTopology)
        {
            return static_cast<vk::PrimitiveTopology>(primitiveTopology);
        }

        std::string_view toString(const PrimitiveTopology primitiveTopology)
        {
            return magic_enum::enum_name(primitiveTopology);
        }
    } // namespace rhi
} // namespace multidraw
