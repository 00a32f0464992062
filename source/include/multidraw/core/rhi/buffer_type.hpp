#pragma once

#include <vulkan/vulkan.hpp>

#include <string_view>

namespace multidraw
{
    namespace rhi
    {
        // What the device reads the buffer as.
        enum class BufferType
        {
            eVertexBuffer,
            eIndexBuffer,
            eDrawIndirectBuffer,
        };

        [[nodiscard]] vk::BufferUsageFlags toVk(const BufferType);
        [[nodiscard]] std::string_view     toString(const BufferType);
    } // namespace rhi
} // namespace multidraw
