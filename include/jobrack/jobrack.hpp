#pragma once

/**
 * @file jobrack.hpp
 * @brief Main header for jobrack - supervised worker pools with progress reporting
 *
 * Include this single header to access the full jobrack API.
 */

#include "jobrack/core/signal.hpp"
#include "jobrack/core/channel.hpp"
#include "jobrack/core/semaphore.hpp"
#include "jobrack/core/metrics.hpp"
#include "jobrack/core/log.hpp"
#include "jobrack/core/work.hpp"
#include "jobrack/core/progress.hpp"
#include "jobrack/core/progress_logger.hpp"
#include "jobrack/core/job.hpp"

namespace jobrack {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace jobrack
