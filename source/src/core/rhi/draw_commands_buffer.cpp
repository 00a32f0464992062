#include "multidraw/core/rhi/draw_commands_buffer.hpp"

namespace multidraw
{
    namespace rhi
    {
        DrawCommandsNoIndicesBuffer::DrawCommandsNoIndicesBuffer(View&& view) : BasicDrawCommandsBuffer(std::move(view))
        {}

        IndicesSource DrawCommandsNoIndicesBuffer::withPrimitiveTopology(const PrimitiveTopology primitives) const
        {
            return MultidrawArray {
                .commands   = borrowCommands(),
                .primitives = primitives,
            };
        }

        DrawCommandsIndicesBuffer::DrawCommandsIndicesBuffer(View&& view) : BasicDrawCommandsBuffer(std::move(view)) {}

        IndicesSource DrawCommandsIndicesBuffer::withIndexBuffer(const IndexBuffer& indexBuffer) const
        {
            return MultidrawElement {
                .commands   = borrowCommands(),
                .indices    = indexBuffer.asSliceAny(),
                .dataType   = indexBuffer.getIndexType(),
                .primitives = indexBuffer.getPrimitiveTopology(),
            };
        }
    } // namespace rhi
} // namespace multidraw
