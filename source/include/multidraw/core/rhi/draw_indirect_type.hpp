#pragma once

#include <cstdint>
#include <string_view>

namespace multidraw
{
    namespace rhi
    {
        enum class DrawIndirectType : uint8_t
        {
            eNonIndexed,
            eIndexed
        };

        [[nodiscard]] std::string_view toString(const DrawIndirectType);
    } // namespace rhi
} // namespace multidraw
