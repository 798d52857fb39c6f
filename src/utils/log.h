/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace mptree::log {
void info(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace mptree::log

#define MPTREE_LOG_INFO(fmt, ...) ::mptree::log::info(fmt, ##__VA_ARGS__)
#define MPTREE_LOG_ERROR(fmt, ...) ::mptree::log::error(fmt, ##__VA_ARGS__)
