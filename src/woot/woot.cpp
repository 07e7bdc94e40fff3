#include "woot/woot.h"
#include "woot/util.h"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <random>

namespace woot
{
nlohmann::json woot_cfg = {};

static std::atomic<bool> running{ false };
static std::atomic<bool> debug{ false };

bool
get_running_state ()
{
    return running;
}

int
set_running_state (const bool state)
{
    running = state;
    return 0;
}

bool
get_debug_state ()
{
    return debug;
}

int
set_debug_state (const bool state)
{
    debug = state;
    fprintf (stderr, "[INFO] Debug mode %s\n",
             state ? "enabled" : "disabled");
    return 0;
}

int
load_config (const std::string &config_file)
{
    std::ifstream scs (config_file);
    if (!scs.is_open ())
        {
            fprintf (stderr, "[ERROR] No config file exist: %s\n",
                     config_file.c_str ());
            return -1;
        }

    try
        {
            scs >> woot_cfg;
        }
    catch (const nlohmann::json::exception &e)
        {
            fprintf (stderr, "[ERROR] Invalid config file %s: %s\n",
                     config_file.c_str (), e.what ());
            scs.close ();
            return -2;
        }

    scs.close ();

    return 0;
}

player::session_config_t
get_session_config ()
{
    player::session_config_t c;

    c.idle_timeout_ms
        = get_config_value<long long> ("IDLE_TIMEOUT_MS", c.idle_timeout_ms);
    c.max_consecutive_failures = get_config_value<int> (
        "MAX_CONSECUTIVE_FAILURES", c.max_consecutive_failures);
    c.volume_min = get_config_value<float> ("VOLUME_MIN", c.volume_min);
    c.volume_max = get_config_value<float> ("VOLUME_MAX", c.volume_max);
    c.default_volume
        = get_config_value<float> ("DEFAULT_VOLUME", c.default_volume);
    c.stream_ttl_ms
        = get_config_value<long long> ("STREAM_URL_TTL_MS", c.stream_ttl_ms);

    if (c.volume_min > c.volume_max)
        {
            fprintf (stderr,
                     "[WARN] VOLUME_MIN %f larger than VOLUME_MAX %f, "
                     "swapping\n",
                     c.volume_min, c.volume_max);
            std::swap (c.volume_min, c.volume_max);
        }

    if (c.max_consecutive_failures < 1)
        c.max_consecutive_failures = 1;

    return c;
}

std::pair<dpp::channel *, std::map<dpp::snowflake, dpp::voicestate> >
get_voice_from_gid (const dpp::snowflake &guild_id,
                    const dpp::snowflake &user_id)
{
    dpp::guild *g = dpp::find_guild (guild_id);
    if (!g)
        return { NULL, {} };

    for (const auto &fc : g->channels)
        {
            auto gc = dpp::find_channel (fc);
            if (!gc || (!gc->is_voice_channel () && !gc->is_stage_channel ()))
                continue;

            std::map<dpp::snowflake, dpp::voicestate> vm
                = gc->get_voice_members ();

            if (vm.find (user_id) != vm.end ())
                {
                    return { gc, vm };
                }
        }

    return { NULL, {} };
}

std::string
format_duration (uint64_t dur)
{
    uint64_t secondr = dur / 1000;
    uint64_t minuter = secondr / 60;

    uint64_t hour = minuter / 60;
    uint8_t minute = minuter % 60;
    uint8_t second = secondr % 60;

    char buf[64];
    if (hour)
        snprintf (buf, sizeof (buf), "%02lu:%02u:%02u", (unsigned long)hour,
                  minute, second);
    else
        snprintf (buf, sizeof (buf), "%02u:%02u", minute, second);

    return buf;
}

std::vector<size_t>
shuffle_indexes (size_t len)
{
    std::vector<size_t> ret;
    ret.reserve (len);

    for (size_t i = 0; i < len; i++)
        ret.push_back (i);

    static thread_local std::mt19937 gen (
        (unsigned int)util::get_current_ts ());

    std::shuffle (ret.begin (), ret.end (), gen);

    return ret;
}

exception::exception (const std::string &_message, int _code)
{
    message = _message;
    c = _code;
}

const char *
exception::what () const noexcept
{
    return message.c_str ();
}

int
exception::code () const noexcept
{
    return c;
}

} // woot
