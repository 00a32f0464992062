#pragma once

namespace multidraw
{
    template<class... Ts>
    struct Overload : Ts...
    {
        using Ts::operator()...;
    };
} // namespace multidraw
