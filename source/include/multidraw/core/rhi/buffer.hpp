#pragma once

#include "multidraw/core/base/base.hpp"
#include "multidraw/core/rhi/buffer_mode.hpp"
#include "multidraw/core/rhi/buffer_type.hpp"

#include <vulkan/vulkan.hpp>

namespace multidraw
{
    namespace rhi
    {
        // Device memory bound to a vk::Buffer, as handed out by a Facade.
        class BufferAllocation
        {
        public:
            virtual ~BufferAllocation() = default;

            [[nodiscard]] virtual vk::Buffer     getHandle() const = 0;
            [[nodiscard]] virtual vk::DeviceSize getSize() const   = 0;

            virtual void* map()                                              = 0;
            virtual void  unmap()                                            = 0;
            virtual void  flush(vk::DeviceSize offset, vk::DeviceSize size) = 0;
        };

        // Untyped, non-owning view over a byte range of a Buffer.
        // Holds a weak token of the allocation, so a slice never extends the buffer lifetime.
        struct BufferAnySlice
        {
            vk::Buffer     handle {nullptr};
            vk::DeviceSize offset {0};
            vk::DeviceSize size {0};
            uint32_t       stride {0};

            WeakRef<const BufferAllocation> allocation;

            // A zero-byte slice is alive as long as it has nothing to reference.
            [[nodiscard]] bool     isAlive() const { return size == 0 || !allocation.expired(); }
            [[nodiscard]] uint32_t getElementCount() const
            {
                return stride > 0 ? static_cast<uint32_t>(size / stride) : 0;
            }
        };

        class Buffer
        {
        public:
            Buffer() = default;
            Buffer(BufferType, BufferMode, Ref<BufferAllocation>);
            Buffer(const Buffer&) = delete;
            Buffer(Buffer&&) noexcept;
            virtual ~Buffer();

            Buffer& operator=(const Buffer&) = delete;
            Buffer& operator=(Buffer&&) noexcept;

            [[nodiscard]] explicit operator bool() const;

            using Stride = uint32_t;

            [[nodiscard]] BufferType     getType() const;
            [[nodiscard]] BufferMode     getMode() const;
            [[nodiscard]] vk::Buffer     getHandle() const;
            [[nodiscard]] vk::DeviceSize getSize() const;
            [[nodiscard]] bool           isMapped() const;

            void*   map();
            Buffer& unmap();

            Buffer& flush(vk::DeviceSize offset = 0, vk::DeviceSize size = vk::WholeSize);

            [[nodiscard]] BufferAnySlice asSliceAny(vk::DeviceSize offset, vk::DeviceSize size, Stride) const;

        private:
            void destroy() noexcept;

        private:
            BufferType            m_Type {BufferType::eVertexBuffer};
            BufferMode            m_Mode {BufferMode::eDefault};
            Ref<BufferAllocation> m_Allocation {nullptr};
            void*                 m_MappedMemory {nullptr};
        };
    } // namespace rhi
} // namespace multidraw
