#pragma once

#include "multidraw/core/base/common_context.hpp"

#include <stdexcept>

#ifndef MULTIDRAW_VK_CHECK
#define MULTIDRAW_VK_CHECK(result, tag, except) \
    if (const auto res = result; res != vk::Result::eSuccess) \
    { \
        MULTIDRAW_CORE_ERROR("[{}] {} ({}:{}): {}", tag, except, __FILE__, __LINE__, vk::to_string(res)); \
        throw std::runtime_error(except); \
    }
#endif
