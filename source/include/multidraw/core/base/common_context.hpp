#pragma once

#include "multidraw/core/base/logger.hpp"

namespace multidraw
{
    struct CommonContext
    {
        CommonContext();

        Logger logger;
    };

    extern CommonContext commonContext;

#define MULTIDRAW_CORE_TRACE(...) ::multidraw::commonContext.logger.trace(true, __VA_ARGS__);
#define MULTIDRAW_CORE_INFO(...) ::multidraw::commonContext.logger.info(true, __VA_ARGS__);
#define MULTIDRAW_CORE_WARN(...) ::multidraw::commonContext.logger.warn(true, __VA_ARGS__);
#define MULTIDRAW_CORE_ERROR(...) ::multidraw::commonContext.logger.error(true, __VA_ARGS__);
#define MULTIDRAW_CORE_CRITICAL(...) ::multidraw::commonContext.logger.critical(true, __VA_ARGS__);

#define MULTIDRAW_CLIENT_TRACE(...) ::multidraw::commonContext.logger.trace(false, __VA_ARGS__);
#define MULTIDRAW_CLIENT_INFO(...) ::multidraw::commonContext.logger.info(false, __VA_ARGS__);
#define MULTIDRAW_CLIENT_WARN(...) ::multidraw::commonContext.logger.warn(false, __VA_ARGS__);
#define MULTIDRAW_CLIENT_ERROR(...) ::multidraw::commonContext.logger.error(false, __VA_ARGS__);
#define MULTIDRAW_CLIENT_CRITICAL(...) ::multidraw::commonContext.logger.critical(false, __VA_ARGS__);
} // namespace multidraw
