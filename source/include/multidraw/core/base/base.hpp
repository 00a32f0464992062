#pragma once

#include <cassert>
#include <memory>

#ifdef _WIN32
#include <intrin.h> // for __debugbreak
#define MULTIDRAW_DEBUG_BREAK() __debugbreak()
#elif defined(__GNUC__) || defined(__clang__)
#include <signal.h> // for raise & SIGTRAP
#define MULTIDRAW_DEBUG_BREAK() raise(SIGTRAP)
#else
#include <cstdlib>
#define MULTIDRAW_DEBUG_BREAK() abort()
#endif

#ifndef MULTIDRAW_CUSTOM_ASSERT
#ifdef NDEBUG
#define MULTIDRAW_CUSTOM_ASSERT(condition) ((void)0)
#else
#define MULTIDRAW_CUSTOM_ASSERT(condition) \
    do \
    { \
        if (!(condition)) \
        { \
            MULTIDRAW_DEBUG_BREAK(); \
            assert(condition); \
        } \
    } while (false)
#endif
#endif

namespace multidraw
{
    template<typename T>
    using Ref = std::shared_ptr<T>;

    template<typename T, typename... Args>
    constexpr Ref<T> createRef(Args&&... args)
    {
        return std::make_shared<T>(std::forward<Args>(args)...);
    }

    template<typename T>
    using WeakRef = std::weak_ptr<T>;
} // namespace multidraw
