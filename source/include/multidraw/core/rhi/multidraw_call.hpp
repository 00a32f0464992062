#pragma once

#include "multidraw/core/rhi/facade.hpp"
#include "multidraw/core/rhi/indices_source.hpp"

#include <vector>

namespace multidraw
{
    namespace rhi
    {
        // An IndicesSource flattened to what vkCmdDraw(Indexed)Indirect needs.
        struct MultiDrawCall
        {
            DrawIndirectType type {DrawIndirectType::eNonIndexed};

            vk::Buffer     commandBuffer {nullptr};
            vk::DeviceSize commandOffset {0};
            uint32_t       drawCount {0};
            uint32_t       stride {0};

            // Only for indexed draws.
            vk::Buffer     indexBuffer {nullptr};
            vk::DeviceSize indexOffset {0};
            vk::IndexType  indexType {vk::IndexType::eNoneKHR};

            vk::PrimitiveTopology topology {vk::PrimitiveTopology::eTriangleList};
        };

        // One indirect draw call: `drawCount` records starting at `offset`.
        struct IndirectDispatch
        {
            vk::DeviceSize offset {0};
            uint32_t       drawCount {0};

            bool operator==(const IndirectDispatch&) const = default;
        };

        // Throws std::runtime_error when a buffer the source borrows from is gone.
        [[nodiscard]] MultiDrawCall resolveMultiDraw(const IndicesSource&);

        // Splits the call by maxDrawIndirectCount, or into one dispatch per record
        // when the device cannot draw more than one record per call.
        [[nodiscard]] std::vector<IndirectDispatch> planMultiDraw(const MultiDrawCall&, const DeviceCapabilities&);
    } // namespace rhi
} // namespace multidraw
