#pragma once

#include "multidraw/core/rhi/buffer.hpp"
#include "multidraw/core/rhi/buffer_creation_error.hpp"

#include <expected>
#include <limits>

namespace multidraw
{
    namespace rhi
    {
        struct DeviceCapabilities
        {
            // VkPhysicalDeviceFeatures::multiDrawIndirect
            bool multiDrawIndirect {true};
            // VkPhysicalDeviceFeatures::drawIndirectFirstInstance
            bool drawIndirectFirstInstance {true};
            // VkPhysicalDeviceLimits::maxDrawIndirectCount
            uint32_t maxDrawIndirectCount {std::numeric_limits<uint32_t>::max()};
            // VkPhysicalDeviceMaintenance3Properties::maxMemoryAllocationSize
            vk::DeviceSize maxMemoryAllocationSize {std::numeric_limits<vk::DeviceSize>::max()};
        };

        // The device context buffers are allocated from.
        class Facade
        {
        public:
            virtual ~Facade() = default;

            [[nodiscard]] virtual const DeviceCapabilities& getCapabilities() const = 0;

            // Either a buffer of exactly `size` bytes, or an error. A zero size yields an empty buffer.
            [[nodiscard]] virtual std::expected<Buffer, BufferCreationError>
            createBuffer(BufferType, vk::DeviceSize size, BufferMode) const = 0;
        };
    } // namespace rhi
} // namespace multidraw
