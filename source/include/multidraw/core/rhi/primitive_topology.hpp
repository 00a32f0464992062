#pragma once

#include <vulkan/vulkan.hpp>

#include <string_view>

namespace multidraw
{
    namespace rhi
    {
        // https://registry.khronos.org/vulkan/specs/1.3/html/chap21.html#VkPrimitiveTopology
        enum class PrimitiveTopology
        {
            ePointList                  = VK_PRIMITIVE_TOPOLOGY_POINT_LIST,
            eLineList                   = VK_PRIMITIVE_TOPOLOGY_LINE_LIST,
            eLineStrip                  = VK_PRIMITIVE_TOPOLOGY_LINE_STRIP,
            eTriangleList               = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST,
            eTriangleStrip              = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP,
            eTriangleFan                = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_FAN,
            eLineListWithAdjacency      = VK_PRIMITIVE_TOPOLOGY_LINE_LIST_WITH_ADJACENCY,
            eLineStripWithAdjacency     = VK_PRIMITIVE_TOPOLOGY_LINE_STRIP_WITH_ADJACENCY,
            eTriangleListWithAdjacency  = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST_WITH_ADJACENCY,
            eTriangleStripWithAdjacency = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP_WITH_ADJACENCY,
            ePatchList                  = VK_PRIMITIVE_TOPOLOGY_PATCH_LIST,
        };

        [[nodiscard]] vk::PrimitiveTopology toVk(const PrimitiveTopology);
        [[nodiscard]] std::string_view      toString(const PrimitiveTopology);
    } // namespace rhi
} // namespace multidraw
