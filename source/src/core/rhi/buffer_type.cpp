#include "multidraw/core/rhi/buffer_type.hpp"

#include <magic_enum/magic_enum.hpp>

namespace multidraw
{
    namespace rhi
    {
        vk::BufferUsageFlags toVk(const BufferType bufferType)
        {
            switch (bufferType)
            {
                using enum BufferType;

                case eVertexBuffer:
                    return vk::BufferUsageFlagBits::eVertexBuffer | vk::BufferUsageFlagBits::eTransferDst;
                case eIndexBuffer:
                    return vk::BufferUsageFlagBits::eIndexBuffer | vk::BufferUsageFlagBits::eTransferDst;
                case eDrawIndirectBuffer:
                    return vk::BufferUsageFlagBits::eIndirectBuffer | vk::BufferUsageFlagBits::eTransferDst;

                default:
                    assert(false);
                    return {};
            }
        }

        std::string_view toString(const BufferType bufferType) { return magic_enum::enum_name(bufferType); }
    } // namespace rhi
} // namespace multidraw
