#include "multidraw/core/rhi/render_device.hpp"
#include "multidraw/core/rhi/vk/macro.hpp"

#include <fmt/format.h>

namespace
{
    using namespace multidraw::rhi;

    constexpr auto LOGTAG = "RenderDevice";

    class VmaBufferAllocation final : public BufferAllocation
    {
    public:
        VmaBufferAllocation(const vma::Allocator  memoryAllocator,
                            const vma::Allocation allocation,
                            const vk::Buffer      handle,
                            const vk::DeviceSize  size,
                            void*                 persistentData) :
            m_MemoryAllocator(memoryAllocator), m_Allocation(allocation), m_Handle(handle), m_Size(size),
            m_PersistentData(persistentData)
        {}
        VmaBufferAllocation(const VmaBufferAllocation&) = delete;
        ~VmaBufferAllocation() override
        {
            if (m_MappedMemory && !m_PersistentData)
            {
                m_MemoryAllocator.unmapMemory(m_Allocation);
            }
            m_MemoryAllocator.destroyBuffer(m_Handle, m_Allocation);
        }

        VmaBufferAllocation& operator=(const VmaBufferAllocation&) = delete;

        [[nodiscard]] vk::Buffer     getHandle() const override { return m_Handle; }
        [[nodiscard]] vk::DeviceSize getSize() const override { return m_Size; }

        void* map() override
        {
            if (!m_MappedMemory)
            {
                if (m_PersistentData)
                {
                    m_MappedMemory = m_PersistentData;
                }
                else
                {
                    MULTIDRAW_VK_CHECK(m_MemoryAllocator.mapMemory(m_Allocation, &m_MappedMemory),
                                       "Buffer",
                                       "Failed to map memory");
                }
            }
            return m_MappedMemory;
        }

        void unmap() override
        {
            // Memory created with eMapped stays mapped by VMA itself.
            if (m_MappedMemory && !m_PersistentData)
            {
                m_MemoryAllocator.unmapMemory(m_Allocation);
            }
            m_MappedMemory = nullptr;
        }

        void flush(const vk::DeviceSize offset, const vk::DeviceSize size) override
        {
            m_MemoryAllocator.flushAllocation(m_Allocation, offset, size);
        }

    private:
        vma::Allocator  m_MemoryAllocator {nullptr};
        vma::Allocation m_Allocation {nullptr};
        vk::Buffer      m_Handle {nullptr};
        vk::DeviceSize  m_Size {0};
        void*           m_PersistentData {nullptr};
        void*           m_MappedMemory {nullptr};
    };

    struct AllocationStrategy
    {
        vma::MemoryUsage           memoryUsage {vma::MemoryUsage::eAuto};
        vma::AllocationCreateFlags flags {};
    };

    [[nodiscard]] AllocationStrategy makeAllocationStrategy(const BufferMode mode)
    {
        switch (mode)
        {
            using enum BufferMode;

            case eDefault:
                return {vma::MemoryUsage::eAuto, vma::AllocationCreateFlagBits::eHostAccessSequentialWrite};
            case eDynamic:
                return {vma::MemoryUsage::eAutoPreferHost, vma::AllocationCreateFlagBits::eHostAccessRandom};
            case ePersistent:
                return {vma::MemoryUsage::eAuto,
                        vma::AllocationCreateFlagBits::eHostAccessSequentialWrite |
                            vma::AllocationCreateFlagBits::eMapped};
            case eImmutable:
                return {vma::MemoryUsage::eAutoPreferDevice,
                        vma::AllocationCreateFlagBits::eHostAccessSequentialWrite |
                            vma::AllocationCreateFlagBits::eStrategyMinMemory};

            default:
                assert(false);
                return {};
        }
    }

    [[nodiscard]] BufferCreationError::Kind toErrorKind(const vk::Result result)
    {
        switch (result)
        {
            case vk::Result::eErrorOutOfDeviceMemory:
            case vk::Result::eErrorOutOfHostMemory:
                return BufferCreationError::Kind::eOutOfMemory;

            default:
                return BufferCreationError::Kind::eUnsupportedUsage;
        }
    }

    [[nodiscard]] std::unexpected<BufferCreationError> reject(const BufferCreationError::Kind kind,
                                                              std::string                     message)
    {
        BufferCreationError error {kind, std::move(message)};
        MULTIDRAW_CORE_ERROR("[{}] Failed to create buffer: {}", LOGTAG, error.toString());
        return std::unexpected {std::move(error)};
    }
} // namespace

namespace multidraw
{
    namespace rhi
    {
        RenderDevice::RenderDevice(const vma::Allocator memoryAllocator, const DeviceCapabilities capabilities) :
            m_MemoryAllocator(memoryAllocator), m_Capabilities(capabilities)
        {
            assert(m_MemoryAllocator);

            MULTIDRAW_CORE_TRACE("[{}] Created, multiDrawIndirect: {}, maxDrawIndirectCount: {}",
                                 LOGTAG,
                                 m_Capabilities.multiDrawIndirect,
                                 m_Capabilities.maxDrawIndirectCount);
        }

        DeviceCapabilities RenderDevice::queryCapabilities(const vk::PhysicalDevice physicalDevice)
        {
            const auto properties =
                physicalDevice
                    .getProperties2<vk::PhysicalDeviceProperties2, vk::PhysicalDeviceMaintenance3Properties>();
            const auto features = physicalDevice.getFeatures();

            const auto& limits = properties.get<vk::PhysicalDeviceProperties2>().properties.limits;

            return DeviceCapabilities {
                .multiDrawIndirect         = features.multiDrawIndirect == VK_TRUE,
                .drawIndirectFirstInstance = features.drawIndirectFirstInstance == VK_TRUE,
                .maxDrawIndirectCount      = limits.maxDrawIndirectCount,
                .maxMemoryAllocationSize =
                    properties.get<vk::PhysicalDeviceMaintenance3Properties>().maxMemoryAllocationSize,
            };
        }

        const DeviceCapabilities& RenderDevice::getCapabilities() const { return m_Capabilities; }

        std::expected<Buffer, BufferCreationError>
        RenderDevice::createBuffer(const BufferType type, const vk::DeviceSize size, const BufferMode mode) const
        {
            if (size > m_Capabilities.maxMemoryAllocationSize)
            {
                return reject(BufferCreationError::Kind::eSizeLimitExceeded,
                              fmt::format("{} bytes requested, the device allows {}",
                                          size,
                                          m_Capabilities.maxMemoryAllocationSize));
            }

            // Vulkan has no zero-sized buffers.
            if (size == 0)
            {
                return Buffer {type, mode, nullptr};
            }

            vk::BufferCreateInfo bufferCreateInfo {};
            bufferCreateInfo.size        = size;
            bufferCreateInfo.usage       = toVk(type);
            bufferCreateInfo.sharingMode = vk::SharingMode::eExclusive;

            const auto strategy = makeAllocationStrategy(mode);

            vma::AllocationCreateInfo memoryAllocationCreateInfo {};
            memoryAllocationCreateInfo.usage = strategy.memoryUsage;
            memoryAllocationCreateInfo.flags = strategy.flags;

            vk::Buffer          handle {nullptr};
            vma::Allocation     allocation {nullptr};
            vma::AllocationInfo allocationInfo {};
            if (const auto result = m_MemoryAllocator.createBuffer(
                    &bufferCreateInfo, &memoryAllocationCreateInfo, &handle, &allocation, &allocationInfo);
                result != vk::Result::eSuccess)
            {
                return reject(toErrorKind(result), vk::to_string(result));
            }

            MULTIDRAW_CORE_TRACE(
                "[{}] Created {} buffer, size: {}, mode: {}", LOGTAG, toString(type), size, toString(mode));

            return Buffer {
                type,
                mode,
                createRef<VmaBufferAllocation>(
                    m_MemoryAllocator,
                    allocation,
                    handle,
                    size,
                    mode == BufferMode::ePersistent ? allocationInfo.pMappedData : nullptr),
            };
        }
    } // namespace rhi
} // namespace multidraw
