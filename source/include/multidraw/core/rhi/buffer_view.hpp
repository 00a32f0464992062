#pragma once

#include "multidraw/core/base/common_context.hpp"
#include "multidraw/core/rhi/facade.hpp"

#include <fmt/format.h>

#include <cstring>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace multidraw
{
    namespace rhi
    {
        // A Buffer holding an array of `T`, with a fixed element count.
        template<typename T>
        class BufferView
        {
            static_assert(std::is_trivially_copyable_v<T>, "BufferView elements are copied byte-wise");

        public:
            // Host access to the whole array. Flushes and unmaps when it goes out of scope
            // (persistent buffers stay mapped).
            class Mapping
            {
            public:
                Mapping(const Mapping&) = delete;
                Mapping(Mapping&&)      = delete;
                ~Mapping()
                {
                    if (!m_View)
                        return;

                    --m_View->m_ActiveMappings;
                    if (!m_Elements.empty())
                    {
                        m_View->m_Buffer.flush(0, m_Elements.size_bytes());
                        m_View->release();
                    }
                }

                Mapping& operator=(const Mapping&) = delete;
                Mapping& operator=(Mapping&&)      = delete;

                [[nodiscard]] std::span<T> get() const { return m_Elements; }
                [[nodiscard]] std::size_t  size() const { return m_Elements.size(); }

                T& operator[](const std::size_t index) const { return m_Elements[index]; }

                [[nodiscard]] auto begin() const { return m_Elements.begin(); }
                [[nodiscard]] auto end() const { return m_Elements.end(); }

            private:
                friend class BufferView;

                explicit Mapping(BufferView& view) : m_View(&view)
                {
                    ++m_View->m_ActiveMappings;
                    if (m_View->m_ElementCount > 0)
                    {
                        m_Elements = {static_cast<T*>(m_View->acquire()), m_View->m_ElementCount};
                    }
                }

            private:
                BufferView*  m_View {nullptr};
                std::span<T> m_Elements;
            };

            BufferView() = default;
            BufferView(const BufferView&) = delete;
            BufferView(BufferView&& other) noexcept :
                m_Buffer(std::move(other.m_Buffer)), m_ElementCount(other.m_ElementCount)
            {
                assert(other.m_ActiveMappings == 0);
                other.m_ElementCount = 0;
            }
            ~BufferView() = default;

            BufferView& operator=(const BufferView&) = delete;
            BufferView& operator=(BufferView&& rhs) noexcept
            {
                if (this != &rhs)
                {
                    assert(m_ActiveMappings == 0 && rhs.m_ActiveMappings == 0);
                    m_Buffer       = std::move(rhs.m_Buffer);
                    m_ElementCount = std::exchange(rhs.m_ElementCount, 0);
                }
                return *this;
            }

            // Allocates room for `elements` values of T, content is undefined.
            [[nodiscard]] static std::expected<BufferView, BufferCreationError>
            emptyArray(const Facade& facade, const BufferType type, const std::size_t elements, const BufferMode mode)
            {
                if (elements > std::numeric_limits<uint32_t>::max() ||
                    elements > std::numeric_limits<vk::DeviceSize>::max() / sizeof(T))
                {
                    BufferCreationError error {
                        BufferCreationError::Kind::eSizeLimitExceeded,
                        fmt::format("{} elements of {} bytes cannot be addressed", elements, sizeof(T)),
                    };
                    MULTIDRAW_CORE_ERROR("[BufferView] {}", error.toString());
                    return std::unexpected {std::move(error)};
                }

                const auto size = static_cast<vk::DeviceSize>(elements) * sizeof(T);

                auto buffer = facade.createBuffer(type, size, mode);
                if (!buffer)
                {
                    return std::unexpected {std::move(buffer.error())};
                }
                if (buffer->getSize() != size)
                {
                    BufferCreationError error {
                        BufferCreationError::Kind::eUnsupportedUsage,
                        fmt::format("requested {} bytes, got {}", size, buffer->getSize()),
                    };
                    MULTIDRAW_CORE_ERROR("[BufferView] {}", error.toString());
                    return std::unexpected {std::move(error)};
                }

                return BufferView {std::move(*buffer), elements};
            }

            [[nodiscard]] static std::expected<BufferView, BufferCreationError>
            fromData(const Facade& facade, const BufferType type, std::span<const T> data, const BufferMode mode)
            {
                auto view = emptyArray(facade, type, data.size(), mode);
                if (view)
                {
                    view->write(data);
                }
                return view;
            }

            [[nodiscard]] std::size_t    getElementCount() const { return m_ElementCount; }
            [[nodiscard]] vk::DeviceSize getSize() const { return m_ElementCount * sizeof(T); }
            [[nodiscard]] bool           isEmpty() const { return m_ElementCount == 0; }

            [[nodiscard]] const Buffer& getBuffer() const { return m_Buffer; }
            [[nodiscard]] Buffer&       getBuffer() { return m_Buffer; }

            [[nodiscard]] bool hasActiveMapping() const { return m_ActiveMappings > 0; }

            [[nodiscard]] Mapping map() { return Mapping {*this}; }

            // Replaces the whole content, `data` must hold exactly getElementCount() values.
            BufferView& write(std::span<const T> data)
            {
                if (data.size() != m_ElementCount)
                {
                    throw std::invalid_argument {fmt::format(
                        "BufferView::write: {} elements given, the buffer holds {}", data.size(), m_ElementCount)};
                }
                if (!data.empty())
                {
                    std::memcpy(acquire(), data.data(), data.size_bytes());
                    m_Buffer.flush(0, data.size_bytes());
                    release();
                }
                return *this;
            }

            BufferView& write(const std::size_t index, const T& value)
            {
                checkIndex(index);

                auto* mapped = static_cast<std::byte*>(acquire());
                std::memcpy(mapped + index * sizeof(T), &value, sizeof(T));
                m_Buffer.flush(index * sizeof(T), sizeof(T));
                release();
                return *this;
            }

            [[nodiscard]] std::vector<T> read()
            {
                std::vector<T> result(m_ElementCount);
                if (m_ElementCount > 0)
                {
                    std::memcpy(result.data(), acquire(), getSize());
                    release();
                }
                return result;
            }

            [[nodiscard]] T read(const std::size_t index)
            {
                checkIndex(index);

                T    result;
                auto mapped = static_cast<const std::byte*>(acquire());
                std::memcpy(&result, mapped + index * sizeof(T), sizeof(T));
                release();
                return result;
            }

            // Zero-fills the content.
            BufferView& invalidate()
            {
                if (m_ElementCount > 0)
                {
                    std::memset(acquire(), 0, getSize());
                    m_Buffer.flush(0, getSize());
                    release();
                }
                return *this;
            }

            [[nodiscard]] std::optional<BufferAnySlice> slice(const std::size_t first, const std::size_t count) const
            {
                if (first > m_ElementCount || count > m_ElementCount - first)
                {
                    return std::nullopt;
                }
                return m_Buffer.asSliceAny(first * sizeof(T), count * sizeof(T), sizeof(T));
            }

            [[nodiscard]] BufferAnySlice asSliceAny() const { return m_Buffer.asSliceAny(0, getSize(), sizeof(T)); }

        private:
            BufferView(Buffer&& buffer, const std::size_t elementCount) :
                m_Buffer(std::move(buffer)), m_ElementCount(elementCount)
            {}

            void* acquire() { return m_Buffer.map(); }
            // Keeps the memory mapped while a Mapping still refers to it.
            void release()
            {
                if (m_ActiveMappings == 0)
                {
                    m_Buffer.unmap();
                }
            }

            void checkIndex(const std::size_t index) const
            {
                if (index >= m_ElementCount)
                {
                    throw std::out_of_range {
                        fmt::format("BufferView: index {} is out of range [0, {})", index, m_ElementCount)};
                }
            }

        private:
            Buffer      m_Buffer;
            std::size_t m_ElementCount {0};
            uint32_t    m_ActiveMappings {0};
        };
    } // namespace rhi
} // namespace multidraw
