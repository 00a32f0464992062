#include "multidraw/core/rhi/multidraw_call.hpp"
#include "multidraw/core/base/common_context.hpp"

#include <algorithm>
#include <stdexcept>

namespace multidraw
{
    namespace rhi
    {
        namespace
        {
            constexpr auto LOGTAG = "MultiDraw";
        }

        MultiDrawCall resolveMultiDraw(const IndicesSource& source)
        {
            if (!source.isAlive())
            {
                MULTIDRAW_CORE_ERROR("[{}] The indices source outlived the buffers it borrows from", LOGTAG);
                throw std::runtime_error("Indices source refers to a destroyed buffer");
            }

            const auto& commands = source.getCommands();

            MultiDrawCall call {
                .type          = source.getType(),
                .commandBuffer = commands.handle,
                .commandOffset = commands.offset,
                .drawCount     = commands.getElementCount(),
                .stride        = commands.stride,
                .topology      = toVk(source.getPrimitiveTopology()),
            };

            if (const auto* element = std::get_if<MultidrawElement>(&source.get()))
            {
                call.indexBuffer = element->indices.handle;
                call.indexOffset = element->indices.offset;
                call.indexType   = toVk(element->dataType);
            }

            return call;
        }

        std::vector<IndirectDispatch> planMultiDraw(const MultiDrawCall& call, const DeviceCapabilities& capabilities)
        {
            std::vector<IndirectDispatch> dispatches;
            if (call.drawCount == 0)
            {
                return dispatches;
            }

            const uint32_t maxPerDispatch =
                capabilities.multiDrawIndirect ? std::max(capabilities.maxDrawIndirectCount, 1u) : 1u;

            dispatches.reserve((call.drawCount + maxPerDispatch - 1) / maxPerDispatch);
            for (uint64_t first = 0; first < call.drawCount; first += maxPerDispatch)
            {
                dispatches.push_back({
                    .offset    = call.commandOffset + first * call.stride,
                    .drawCount = static_cast<uint32_t>(std::min<uint64_t>(maxPerDispatch, call.drawCount - first)),
                });
            }

            return dispatches;
        }
    } // namespace rhi
} // namespace multidraw
