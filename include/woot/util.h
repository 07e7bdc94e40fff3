#ifndef WOOT_UTIL_H
#define WOOT_UTIL_H

#include <dpp/dpp.h>
#include <stdint.h>
#include <string>

namespace woot::util
{
/**
 * @brief Join str with join_str if join is true
 */
std::string join (const bool join, const std::string &str,
                  const std::string &join_str);

/**
 * @brief Truncate utf-8 str to max_length characters without splitting a
 * code point
 */
std::string u8_limit_length (const std::string &str, int32_t max_length = 99);

/**
 * @brief Whether numstr is valid number and parse-able to integer types.
 * @return 0 if true, -1 if no length and found invalid char on invalid
 */
char valid_number (const std::string &numstr);

void log_confirmation_error (const dpp::confirmation_callback_t &e,
                             const char *callee = "ERROR");

// returns current monotonic timestamp in nanosecond
long long get_current_ts ();

inline constexpr long long
ms_to_ns (const long long ms)
{
    return ms * 1000000LL;
}

inline constexpr long long
ns_to_ms (const long long ns)
{
    return ns / 1000000LL;
}

/**
 * @brief Render text progress bar, width characters long
 */
std::string progress_bar (const int64_t elapsed_ms, const uint64_t duration_ms,
                          const size_t width = 20);

} // woot::util

#endif // WOOT_UTIL_H
