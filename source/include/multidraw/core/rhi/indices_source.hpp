#pragma once

#include "multidraw/core/rhi/buffer.hpp"
#include "multidraw/core/rhi/draw_indirect_type.hpp"
#include "multidraw/core/rhi/index_buffer.hpp"
#include "multidraw/core/rhi/primitive_topology.hpp"

#include <variant>

namespace multidraw
{
    namespace rhi
    {
        // Records only, each one draws `count` consecutive vertices.
        struct MultidrawArray
        {
            BufferAnySlice    commands;
            PrimitiveTopology primitives {PrimitiveTopology::eTriangleList};
        };

        // Records dereferencing a shared index array.
        struct MultidrawElement
        {
            BufferAnySlice    commands;
            BufferAnySlice    indices;
            IndexType         dataType {IndexType::eUndefined};
            PrimitiveTopology primitives {PrimitiveTopology::eTriangleList};
        };

        // What a multi-draw reads its work from. Borrows the buffers it was built from:
        // build it right before the draw and drop it afterwards.
        class IndicesSource
        {
        public:
            using Variant = std::variant<MultidrawArray, MultidrawElement>;

            IndicesSource(MultidrawArray);
            IndicesSource(MultidrawElement);

            [[nodiscard]] const Variant& get() const;

            [[nodiscard]] DrawIndirectType      getType() const;
            [[nodiscard]] bool                  isIndexed() const;
            [[nodiscard]] PrimitiveTopology     getPrimitiveTopology() const;
            [[nodiscard]] const BufferAnySlice& getCommands() const;
            [[nodiscard]] uint32_t              getDrawCount() const;

            // False once any of the borrowed buffers has been destroyed.
            [[nodiscard]] bool isAlive() const;

        private:
            Variant m_Source;
        };
    } // namespace rhi
} // namespace multidraw
