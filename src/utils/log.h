/**
 * Copyright (c) 2026 Cr4nkSt4r
 */
#pragma once

#include <cstdarg>

namespace rbxmd::log {
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace rbxmd::log

#define RBXMD_LOG_INFO(fmt, ...) ::rbxmd::log::info(fmt, ##__VA_ARGS__)
#define RBXMD_LOG_WARN(fmt, ...) ::rbxmd::log::warn(fmt, ##__VA_ARGS__)
#define RBXMD_LOG_ERROR(fmt, ...) ::rbxmd::log::error(fmt, ##__VA_ARGS__)
