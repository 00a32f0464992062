#include "multidraw/core/base/common_context.hpp"

namespace multidraw
{
    CommonContext::CommonContext() : logger(Logger::Builder {}.setLevel(Logger::Level::eInfo).build()) {}

    CommonContext commonContext;
} // namespace multidraw
