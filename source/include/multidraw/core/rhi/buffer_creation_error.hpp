#pragma once

#include <string>

namespace multidraw
{
    namespace rhi
    {
        struct BufferCreationError
        {
            enum class Kind
            {
                // The device or the host ran out of memory.
                eOutOfMemory,
                // The device does not support the requested type/mode combination.
                eUnsupportedUsage,
                // The requested size exceeds what a single allocation may hold.
                eSizeLimitExceeded,
            };

            Kind        kind {Kind::eOutOfMemory};
            std::string message;

            [[nodiscard]] std::string toString() const;

            bool operator==(const BufferCreationError&) const = default;
        };
    } // namespace rhi
} // namespace multidraw
