#pragma once

#include "multidraw/core/rhi/facade.hpp"

#include <vk_mem_alloc.hpp>

namespace multidraw
{
    namespace rhi
    {
        // Facade over a VMA allocator owned by the application.
        // The allocator must outlive the device and every buffer created from it.
        class RenderDevice final : public Facade
        {
        public:
            RenderDevice(vma::Allocator, DeviceCapabilities);
            RenderDevice(const RenderDevice&)     = delete;
            RenderDevice(RenderDevice&&) noexcept = delete;
            ~RenderDevice() override              = default;

            RenderDevice& operator=(const RenderDevice&)     = delete;
            RenderDevice& operator=(RenderDevice&&) noexcept = delete;

            // Reads the relevant features and limits of a physical device.
            [[nodiscard]] static DeviceCapabilities queryCapabilities(vk::PhysicalDevice);

            [[nodiscard]] const DeviceCapabilities& getCapabilities() const override;

            [[nodiscard]] std::expected<Buffer, BufferCreationError>
            createBuffer(BufferType, vk::DeviceSize size, BufferMode) const override;

        private:
            vma::Allocator     m_MemoryAllocator {nullptr};
            DeviceCapabilities m_Capabilities;
        };
    } // namespace rhi
} // namespace multidraw
