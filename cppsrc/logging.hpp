#pragma once

#include <iostream>

namespace sdrcp {

// Verbosity levels
constexpr int LOG_LEVEL_NONE = 0;
constexpr int LOG_LEVEL_INFO = 1;
constexpr int LOG_LEVEL_DEBUG = 2;

// Set global verbosity level
void set_verbosity(int level);

// Get current verbosity level
int get_verbosity();

} // namespace sdrcp

// Emit one tagged line on stderr when cond holds. expr is a << chain.
#define SDRCP_LOG_IF(cond, tag, expr) do { \
    if (cond) { \
        std::cerr << "[" tag "] " << expr << std::endl; \
    } \
} while (0)

#define SDRCP_LOG_INFO(expr) SDRCP_LOG_IF(::sdrcp::get_verbosity() >= ::sdrcp::LOG_LEVEL_INFO, "INFO", expr)
#define SDRCP_LOG_DEBUG(expr) SDRCP_LOG_IF(::sdrcp::get_verbosity() >= ::sdrcp::LOG_LEVEL_DEBUG, "DEBUG", expr)

// Always shown
#define SDRCP_LOG_WARN(expr) SDRCP_LOG_IF(true, "WARN", expr)
#define SDRCP_LOG_ERROR(expr) SDRCP_LOG_IF(true, "ERROR", expr)
