#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define ECS_LOG_PLATFORM_LINUX 1
#elif defined(_WIN32)
    #define ECS_LOG_PLATFORM_WINDOWS 1
#elif defined(__APPLE__)
    #define ECS_LOG_PLATFORM_MACOS 1
#endif

// ===== 过滤规则所在的环境变量 =====
#ifndef ECS_LOG_ENV_VAR
    #define ECS_LOG_ENV_VAR "ECS_LOG"
#endif

// ===== 未设置环境变量时的默认过滤规则 =====
#ifndef ECS_LOG_DEFAULT_FILTER
    #define ECS_LOG_DEFAULT_FILTER "error"
#endif
