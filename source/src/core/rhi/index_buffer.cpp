#include "multidraw/core/rhi/index_buffer.hpp"
#include "multidraw/core/base/common_context.hpp"

#include <magic_enum/magic_enum.hpp>

#include <limits>
#include <utility>

namespace multidraw
{
    namespace rhi
    {
        vk::IndexType toVk(const IndexType indexType)
        {
            switch (indexType)
            {
                case IndexType::eUInt16:
                    return vk::IndexType::eUint16;
                case IndexType::eUInt32:
                    return vk::IndexType::eUint32;

                default:
                    assert(false);
                    return vk::IndexType::eNoneKHR;
            }
        }

        std::string_view toString(const IndexType indexType) { return magic_enum::enum_name(indexType); }

        std::expected<IndexBuffer, BufferCreationError> IndexBuffer::create(const Facade&           facade,
                                                                            const IndexType         indexType,
                                                                            const PrimitiveTopology primitiveTopology,
                                                                            const vk::DeviceSize    capacity,
                                                                            const BufferMode        mode)
        {
            if (indexType == IndexType::eUndefined)
            {
                BufferCreationError error {BufferCreationError::Kind::eUnsupportedUsage,
                                           "an index buffer needs a defined index type"};
                MULTIDRAW_CORE_ERROR("[IndexBuffer] {}", error.toString());
                return std::unexpected {std::move(error)};
            }

            const auto stride = static_cast<vk::DeviceSize>(indexType);
            if (capacity > std::numeric_limits<vk::DeviceSize>::max() / stride)
            {
                BufferCreationError error {BufferCreationError::Kind::eSizeLimitExceeded,
                                           fmt::format("{} indices cannot be addressed", capacity)};
                MULTIDRAW_CORE_ERROR("[IndexBuffer] {}", error.toString());
                return std::unexpected {std::move(error)};
            }

            auto buffer = facade.createBuffer(BufferType::eIndexBuffer, stride * capacity, mode);
            if (!buffer)
            {
                return std::unexpected {std::move(buffer.error())};
            }

            return IndexBuffer {std::move(*buffer), indexType, primitiveTopology, capacity};
        }

        IndexType IndexBuffer::getIndexType() const { return m_IndexType; }

        PrimitiveTopology IndexBuffer::getPrimitiveTopology() const { return m_PrimitiveTopology; }

        Buffer::Stride IndexBuffer::getStride() const { return std::to_underlying(m_IndexType); }

        vk::DeviceSize IndexBuffer::getCapacity() const { return m_Capacity; }

        BufferAnySlice IndexBuffer::asSliceAny() const
        {
            return Buffer::asSliceAny(0, m_Capacity * getStride(), getStride());
        }

        IndexBuffer::IndexBuffer(Buffer&&                buffer,
                                 const IndexType         indexType,
                                 const PrimitiveTopology primitiveTopology,
                                 const vk::DeviceSize    capacity) :
            Buffer(std::move(buffer)), m_IndexType(indexType), m_PrimitiveTopology(primitiveTopology),
            m_Capacity(capacity)
        {}
    } // namespace rhi
} // namespace multidraw
