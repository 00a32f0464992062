#include "multidraw/core/rhi/buffer.hpp"

namespace multidraw
{
    namespace rhi
    {
        Buffer::Buffer(const BufferType type, const BufferMode mode, Ref<BufferAllocation> allocation) :
            m_Type(type), m_Mode(mode), m_Allocation(std::move(allocation))
        {
            if (m_Allocation && m_Mode == BufferMode::ePersistent)
            {
                map();
            }
        }

        Buffer::Buffer(Buffer&& other) noexcept :
            m_Type(other.m_Type), m_Mode(other.m_Mode), m_Allocation(std::move(other.m_Allocation)),
            m_MappedMemory(other.m_MappedMemory)
        {
            other.m_Allocation   = nullptr;
            other.m_MappedMemory = nullptr;
        }

        Buffer::~Buffer() { destroy(); }

        Buffer& Buffer::operator=(Buffer&& rhs) noexcept
        {
            if (this != &rhs)
            {
                destroy();

                std::swap(m_Type, rhs.m_Type);
                std::swap(m_Mode, rhs.m_Mode);
                std::swap(m_Allocation, rhs.m_Allocation);
                std::swap(m_MappedMemory, rhs.m_MappedMemory);
            }

            return *this;
        }

        Buffer::operator bool() const { return m_Allocation != nullptr; }

        BufferType Buffer::getType() const { return m_Type; }

        BufferMode Buffer::getMode() const { return m_Mode; }

        vk::Buffer Buffer::getHandle() const { return m_Allocation ? m_Allocation->getHandle() : vk::Buffer {}; }

        vk::DeviceSize Buffer::getSize() const { return m_Allocation ? m_Allocation->getSize() : 0; }

        bool Buffer::isMapped() const { return m_MappedMemory != nullptr; }

        void* Buffer::map()
        {
            assert(m_Allocation);

            if (!m_MappedMemory)
            {
                m_MappedMemory = m_Allocation->map();
            }

            return m_MappedMemory;
        }

        Buffer& Buffer::unmap()
        {
            assert(m_Allocation);

            // Persistent buffers stay mapped until destroyed.
            if (m_MappedMemory && m_Mode != BufferMode::ePersistent)
            {
                m_Allocation->unmap();
                m_MappedMemory = nullptr;
            }

            return *this;
        }

        Buffer& Buffer::flush(const vk::DeviceSize offset, const vk::DeviceSize size)
        {
            assert(m_Allocation && m_MappedMemory);

            m_Allocation->flush(offset, size);
            return *this;
        }

        BufferAnySlice Buffer::asSliceAny(const vk::DeviceSize offset, const vk::DeviceSize size, const Stride stride) const
        {
            assert(offset + size <= getSize());

            return BufferAnySlice {
                .handle     = getHandle(),
                .offset     = offset,
                .size       = size,
                .stride     = stride,
                .allocation = m_Allocation,
            };
        }

        void Buffer::destroy() noexcept
        {
            if (m_Allocation)
            {
                if (m_MappedMemory)
                {
                    m_Allocation->unmap();
                }

                m_Allocation.reset();
                m_MappedMemory = nullptr;
            }
        }
    } // namespace rhi
} // namespace multidraw
