#pragma once

#include "multidraw/core/rhi/facade.hpp"
#include "multidraw/core/rhi/primitive_topology.hpp"

#include <cstring>
#include <expected>
#include <span>
#include <stdexcept>

namespace multidraw
{
    namespace rhi
    {
        enum class IndexType
        {
            eUndefined = 0,
            eUInt16    = 2,
            eUInt32    = 4
        };

        [[nodiscard]] vk::IndexType    toVk(const IndexType);
        [[nodiscard]] std::string_view toString(const IndexType);

        template<typename T>
        struct IndexTraits;

        template<>
        struct IndexTraits<uint16_t>
        {
            static constexpr IndexType kType {IndexType::eUInt16};
        };

        template<>
        struct IndexTraits<uint32_t>
        {
            static constexpr IndexType kType {IndexType::eUInt32};
        };

        template<typename T>
        concept Index = requires { IndexTraits<T>::kType; };

        // Indices shared by every record of an indexed multi-draw.
        // The primitive topology is a property of how the indices were built.
        class IndexBuffer final : public Buffer
        {
        public:
            IndexBuffer() = default;

            [[nodiscard]] static std::expected<IndexBuffer, BufferCreationError> create(const Facade&,
                                                                                        IndexType,
                                                                                        PrimitiveTopology,
                                                                                        vk::DeviceSize capacity,
                                                                                        BufferMode = BufferMode::eDefault);

            template<Index T>
            [[nodiscard]] static std::expected<IndexBuffer, BufferCreationError>
            fromIndices(const Facade&     facade,
                        PrimitiveTopology primitiveTopology,
                        std::span<const T> indices,
                        BufferMode        mode = BufferMode::eDefault)
            {
                auto indexBuffer = create(facade, IndexTraits<T>::kType, primitiveTopology, indices.size(), mode);
                if (indexBuffer)
                {
                    indexBuffer->write(indices);
                }
                return indexBuffer;
            }

            [[nodiscard]] IndexType         getIndexType() const;
            [[nodiscard]] PrimitiveTopology getPrimitiveTopology() const;
            [[nodiscard]] Stride            getStride() const;
            [[nodiscard]] vk::DeviceSize    getCapacity() const;

            [[nodiscard]] BufferAnySlice asSliceAny() const;

            // Writes indices starting at `firstIndex`. A mapping taken through map() stays valid.
            template<Index T>
            IndexBuffer& write(std::span<const T> indices, const vk::DeviceSize firstIndex = 0)
            {
                if (IndexTraits<T>::kType != m_IndexType)
                {
                    throw std::invalid_argument {"IndexBuffer::write: index type mismatch"};
                }
                if (firstIndex > m_Capacity || indices.size() > m_Capacity - firstIndex)
                {
                    throw std::out_of_range {"IndexBuffer::write: indices do not fit in the buffer"};
                }
                if (!indices.empty())
                {
                    const bool wasMapped = isMapped();

                    auto* mapped = static_cast<std::byte*>(map());
                    std::memcpy(mapped + firstIndex * sizeof(T), indices.data(), indices.size_bytes());
                    flush(firstIndex * sizeof(T), indices.size_bytes());
                    if (!wasMapped)
                    {
                        unmap();
                    }
                }
                return *this;
            }

        private:
            IndexBuffer(Buffer&&, IndexType, PrimitiveTopology, vk::DeviceSize capacity);

        private:
            IndexType         m_IndexType {IndexType::eUndefined};
            PrimitiveTopology m_PrimitiveTopology {PrimitiveTopology::eTriangleList};
            vk::DeviceSize    m_Capacity {0};
        };
    } // namespace rhi
} // namespace multidraw
