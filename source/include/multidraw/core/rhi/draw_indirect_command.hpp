#pragma once

#include "multidraw/core/rhi/draw_indirect_type.hpp"

#include <fmt/format.h>
#include <vulkan/vulkan.hpp>

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace multidraw
{
    namespace rhi
    {
        // The layouts below are read by the device as-is (VkDrawIndirectCommand and
        // VkDrawIndexedIndirectCommand): four-byte fields, fixed order, no padding.

        // One non-indexed draw.
        struct alignas(4) DrawCommandNoIndices
        {
            // Number of vertices to draw.
            uint32_t count {0};
            // Number of instances to draw. If it's 0, nothing will be drawn.
            uint32_t instanceCount {0};
            // First vertex to draw in the vertices source.
            uint32_t firstIndex {0};
            // Index of the first instance to draw.
            uint32_t baseInstance {0};

            bool operator==(const DrawCommandNoIndices&) const = default;
        };

        // One indexed draw.
        struct alignas(4) DrawCommandIndices
        {
            // Number of indices to use in the index buffer.
            uint32_t count {0};
            // Number of instances to draw. If it's 0, nothing will be drawn.
            uint32_t instanceCount {0};
            // First index to draw in the index buffer.
            uint32_t firstIndex {0};
            // Value added to each index before the vertex is fetched.
            uint32_t baseVertex {0};
            // Index of the first instance to draw.
            uint32_t baseInstance {0};

            bool operator==(const DrawCommandIndices&) const = default;
        };

        template<typename T>
        struct DrawCommandTraits;

        template<>
        struct DrawCommandTraits<DrawCommandNoIndices>
        {
            using DeviceLayout = vk::DrawIndirectCommand;

            static constexpr DrawIndirectType kType {DrawIndirectType::eNonIndexed};
        };

        template<>
        struct DrawCommandTraits<DrawCommandIndices>
        {
            using DeviceLayout = vk::DrawIndexedIndirectCommand;

            static constexpr DrawIndirectType kType {DrawIndirectType::eIndexed};
        };

        template<typename T>
        concept DrawCommand = requires { DrawCommandTraits<T>::kType; };

        static_assert(sizeof(DrawCommandNoIndices) == 16);
        static_assert(alignof(DrawCommandNoIndices) == 4);
        static_assert(std::is_standard_layout_v<DrawCommandNoIndices> &&
                      std::is_trivially_copyable_v<DrawCommandNoIndices>);
        static_assert(offsetof(DrawCommandNoIndices, count) == 0);
        static_assert(offsetof(DrawCommandNoIndices, instanceCount) == 4);
        static_assert(offsetof(DrawCommandNoIndices, firstIndex) == 8);
        static_assert(offsetof(DrawCommandNoIndices, baseInstance) == 12);
        static_assert(sizeof(DrawCommandNoIndices) == sizeof(vk::DrawIndirectCommand));

        static_assert(sizeof(DrawCommandIndices) == 20);
        static_assert(alignof(DrawCommandIndices) == 4);
        static_assert(std::is_standard_layout_v<DrawCommandIndices> &&
                      std::is_trivially_copyable_v<DrawCommandIndices>);
        static_assert(offsetof(DrawCommandIndices, count) == 0);
        static_assert(offsetof(DrawCommandIndices, instanceCount) == 4);
        static_assert(offsetof(DrawCommandIndices, firstIndex) == 8);
        static_assert(offsetof(DrawCommandIndices, baseVertex) == 12);
        static_assert(offsetof(DrawCommandIndices, baseInstance) == 16);
        static_assert(sizeof(DrawCommandIndices) == sizeof(vk::DrawIndexedIndirectCommand));
    } // namespace rhi
} // namespace multidraw

template<>
struct fmt::formatter<multidraw::rhi::DrawCommandNoIndices> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const multidraw::rhi::DrawCommandNoIndices& c, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(),
                              "{{count: {}, instanceCount: {}, firstIndex: {}, baseInstance: {}}}",
                              c.count,
                              c.instanceCount,
                              c.firstIndex,
                              c.baseInstance);
    }
};

template<>
struct fmt::formatter<multidraw::rhi::DrawCommandIndices> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const multidraw::rhi::DrawCommandIndices& c, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(),
                              "{{count: {}, instanceCount: {}, firstIndex: {}, baseVertex: {}, baseInstance: {}}}",
                              c.count,
                              c.instanceCount,
                              c.firstIndex,
                              c.baseVertex,
                              c.baseInstance);
    }
};
