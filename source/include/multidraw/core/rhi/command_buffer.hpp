#pragma once

#include "multidraw/core/rhi/facade.hpp"
#include "multidraw/core/rhi/indices_source.hpp"

namespace multidraw
{
    namespace rhi
    {
        // Records multi-draws into a command buffer the application allocated and began.
        // The bound graphics pipeline must declare the primitive topology as dynamic state.
        class CommandBuffer final
        {
        public:
            CommandBuffer(vk::CommandBuffer, DeviceCapabilities);

            [[nodiscard]] vk::CommandBuffer getHandle() const;

            // The device reads the records when the command buffer executes,
            // so the borrowed buffers must stay alive until then.
            CommandBuffer& drawMultiIndirect(const IndicesSource&);

        private:
            vk::CommandBuffer  m_Handle {nullptr};
            DeviceCapabilities m_Capabilities;
        };
    } // namespace rhi
} // namespace multidraw
