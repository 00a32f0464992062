#pragma once

#include <string_view>

namespace multidraw
{
    namespace rhi
    {
        // Allocation strategy of a buffer. Fixed at creation.
        enum class BufferMode
        {
            // Eager allocation, written occasionally from the host.
            eDefault,
            // Host-cached memory, optimized for frequent updates and read-backs.
            eDynamic,
            // Mapped into the host address space for the whole lifetime of the buffer.
            ePersistent,
            // Device-preferred memory, content is not expected to change after the first upload.
            eImmutable,
        };

        [[nodiscard]] std::string_view toString(const BufferMode);
    } // namespace rhi
} // namespace multidraw
