#include "multidraw/core/rhi/command_buffer.hpp"
#include "multidraw/core/base/common_context.hpp"
#include "multidraw/core/rhi/multidraw_call.hpp"

namespace multidraw
{
    namespace rhi
    {
        CommandBuffer::CommandBuffer(const vk::CommandBuffer handle, const DeviceCapabilities capabilities) :
            m_Handle(handle), m_Capabilities(capabilities)
        {
            assert(m_Handle);
        }

        vk::CommandBuffer CommandBuffer::getHandle() const { return m_Handle; }

        CommandBuffer& CommandBuffer::drawMultiIndirect(const IndicesSource& source)
        {
            const auto call       = resolveMultiDraw(source);
            const auto dispatches = planMultiDraw(call, m_Capabilities);
            if (dispatches.empty())
            {
                return *this;
            }
            if (call.type == DrawIndirectType::eIndexed && !call.indexBuffer)
            {
                MULTIDRAW_CORE_WARN("[CommandBuffer] Skipping {} indexed draws without indices", call.drawCount);
                return *this;
            }

            m_Handle.setPrimitiveTopology(call.topology);

            if (call.type == DrawIndirectType::eIndexed)
            {
                m_Handle.bindIndexBuffer(call.indexBuffer, call.indexOffset, call.indexType);
                for (const auto& dispatch : dispatches)
                {
                    m_Handle.drawIndexedIndirect(call.commandBuffer, dispatch.offset, dispatch.drawCount, call.stride);
                }
            }
            else
            {
                for (const auto& dispatch : dispatches)
                {
                    m_Handle.drawIndirect(call.commandBuffer, dispatch.offset, dispatch.drawCount, call.stride);
                }
            }

            MULTIDRAW_CORE_TRACE("[CommandBuffer] Recorded {} {} draws in {} dispatches",
                                 call.drawCount,
                                 toString(call.type),
                                 dispatches.size());
            return *this;
        }
    } // namespace rhi
} // namespace multidraw
