#pragma once

#include "multidraw/core/rhi/buffer_view.hpp"
#include "multidraw/core/rhi/draw_indirect_command.hpp"
#include "multidraw/core/rhi/index_buffer.hpp"
#include "multidraw/core/rhi/indices_source.hpp"

namespace multidraw
{
    namespace rhi
    {
        // Owns an array of draw commands in device-visible memory.
        // Reads, writes and mappings go through the owned BufferView.
        template<DrawCommand T, typename Derived>
        class BasicDrawCommandsBuffer
        {
        public:
            using Command = T;
            using View    = BufferView<T>;

            [[nodiscard]] static std::expected<Derived, BufferCreationError> empty(const Facade& facade,
                                                                                   const std::size_t elements)
            {
                return create(facade, elements, BufferMode::eDefault);
            }

            [[nodiscard]] static std::expected<Derived, BufferCreationError> emptyDynamic(const Facade& facade,
                                                                                          const std::size_t elements)
            {
                return create(facade, elements, BufferMode::eDynamic);
            }

            [[nodiscard]] static std::expected<Derived, BufferCreationError>
            emptyPersistent(const Facade& facade, const std::size_t elements)
            {
                return create(facade, elements, BufferMode::ePersistent);
            }

            [[nodiscard]] static std::expected<Derived, BufferCreationError>
            emptyImmutable(const Facade& facade, const std::size_t elements)
            {
                return create(facade, elements, BufferMode::eImmutable);
            }

            [[nodiscard]] const View& getView() const { return m_View; }
            [[nodiscard]] View&       getView() { return m_View; }

            const View* operator->() const { return &m_View; }
            View*       operator->() { return &m_View; }
            const View& operator*() const { return m_View; }
            View&       operator*() { return m_View; }

        protected:
            BasicDrawCommandsBuffer() = default;
            explicit BasicDrawCommandsBuffer(View&& view) : m_View(std::move(view)) {}

            [[nodiscard]] BufferAnySlice borrowCommands() const
            {
                // A source must not alias a live host mapping of the same records.
                MULTIDRAW_CUSTOM_ASSERT(!m_View.hasActiveMapping());
                return m_View.asSliceAny();
            }

        private:
            [[nodiscard]] static std::expected<Derived, BufferCreationError>
            create(const Facade& facade, const std::size_t elements, const BufferMode mode)
            {
                return View::emptyArray(facade, BufferType::eDrawIndirectBuffer, elements, mode)
                    .transform([&](View&& view) {
                        MULTIDRAW_CORE_TRACE("[DrawCommandsBuffer] Allocated {} {} commands ({})",
                                             elements,
                                             toString(DrawCommandTraits<T>::kType),
                                             toString(mode));
                        return Derived {std::move(view)};
                    });
            }

        private:
            View m_View;
        };

        // A buffer containing a list of non-indexed draw commands.
        class DrawCommandsNoIndicesBuffer final
            : public BasicDrawCommandsBuffer<DrawCommandNoIndices, DrawCommandsNoIndicesBuffer>
        {
            friend class BasicDrawCommandsBuffer<DrawCommandNoIndices, DrawCommandsNoIndicesBuffer>;

        public:
            DrawCommandsNoIndicesBuffer() = default;

            // Every record draws vertices with the given topology.
            // Record contents are not validated here.
            [[nodiscard]] IndicesSource withPrimitiveTopology(PrimitiveTopology) const;

        private:
            explicit DrawCommandsNoIndicesBuffer(View&&);
        };

        // A buffer containing a list of indexed draw commands.
        class DrawCommandsIndicesBuffer final
            : public BasicDrawCommandsBuffer<DrawCommandIndices, DrawCommandsIndicesBuffer>
        {
            friend class BasicDrawCommandsBuffer<DrawCommandIndices, DrawCommandsIndicesBuffer>;

        public:
            DrawCommandsIndicesBuffer() = default;

            // The index type and the primitive topology come from the index buffer.
            // Both buffers must outlive the returned source.
            [[nodiscard]] IndicesSource withIndexBuffer(const IndexBuffer&) const;

        private:
            explicit DrawCommandsIndicesBuffer(View&&);
        };
    } // namespace rhi
} // namespace multidraw
