#include "woot/util.h"
#include "woot/woot.h"
#include <chrono>
#include <iostream>
#include <stdio.h>
#include <unicode/unistr.h>

namespace woot::util
{

std::string
join (const bool join, const std::string &str, const std::string &join_str)
{
    return join ? str + join_str : str;
}

std::string
u8_limit_length (const std::string &str, int32_t max_length)
{
    icu::UnicodeString ustr = icu::UnicodeString::fromUTF8 (str);

    if (ustr.countChar32 () <= max_length)
        return str;

    // don't cut a surrogate pair in half
    const int32_t end = ustr.moveIndex32 (0, max_length);

    std::string ret;
    ustr.tempSubString (0, end).toUTF8String (ret);

    if (get_debug_state ())
        {
            fprintf (stderr,
                     "[util::u8_limit_length] max_length extracted: '%d' "
                     "'%s'\n",
                     max_length, ret.c_str ());
        }

    return ret;
}

static const char numbers[] = "0123456789";
static const size_t numbers_siz = sizeof (numbers) - 1;

char
valid_number (const std::string &numstr)
{
    if (numstr.empty ())
        return -1;

    for (char c : numstr)
        {
            bool valid = false;
            for (size_t i = 0; i < numbers_siz; i++)
                {
                    if (c == numbers[i])
                        {
                            valid = true;
                            break;
                        }
                }

            if (!valid)
                return c;
        }

    return 0;
}

void
log_confirmation_error (const dpp::confirmation_callback_t &e,
                        const char *callee)
{
    std::cerr << '[' << callee << " ERROR]" << '\n';

    dpp::error_info ev = e.get_error ();
    for (const auto &eve : ev.errors)
        {
            std::cerr << eve.code << ' ' << eve.field << ' ' << eve.reason
                      << ' ' << eve.object << '\n';
        }

    std::cerr << ev.code << ' ' << ev.message << '\n';
}

long long
get_current_ts ()
{
    return std::chrono::duration_cast<std::chrono::nanoseconds> (
               std::chrono::steady_clock::now ().time_since_epoch ())
        .count ();
}

std::string
progress_bar (const int64_t elapsed_ms, const uint64_t duration_ms,
              const size_t width)
{
    if (!width)
        return "";

    size_t filled = 0;
    if (duration_ms && elapsed_ms > 0)
        {
            const uint64_t e = (uint64_t)elapsed_ms > duration_ms
                                   ? duration_ms
                                   : (uint64_t)elapsed_ms;

            filled = (size_t)((e * width) / duration_ms);
        }

    std::string ret;
    ret.reserve (width * 3);

    for (size_t i = 0; i < width; i++)
        {
            ret += i < filled ? "\xe2\x96\xac" : "\xe2\x94\x80";
        }

    return ret;
}

} // woot::util
