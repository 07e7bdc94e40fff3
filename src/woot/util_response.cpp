#include "woot/util_response.h"
#include "woot/woot.h"
#include <cmath>

namespace woot::util::response
{
std::string
str_queue_position (const int64_t &position)
{
    return position == 1  ? "the top of "
                            "the queue"
           : position > 1 ? "position " + std::to_string (position)
                          : "the end of the queue";
}

std::string
reply_added_track (const std::string &title, const int64_t &position)
{
    if (get_debug_state ())
        fprintf (stderr, "track position: '%s' %ld\n", title.c_str (),
                 position);

    return std::string ("Added `") + title + "` to "
           + str_queue_position (position);
}

std::string
reply_loading_track (const std::string &title)
{
    return std::string ("Loading `") + title + "`...";
}

std::string
reply_added_tracks (const size_t count, const bool first_playing)
{
    std::string ret = std::string ("Added ") + std::to_string (count)
                      + " track" + (count != 1 ? "s" : "")
                      + " to the end of the queue";

    if (first_playing)
        ret += ", loading the first one";

    return ret;
}

std::string
str_mention_user (const dpp::snowflake &user_id)
{
    return "<@" + std::to_string (user_id) + ">: ";
}

std::string
reply_command_status (const player::command_status_t status,
                      const std::string &ok_reply)
{
    switch (status)
        {
        case player::CMD_OK:
            return ok_reply;
        case player::CMD_NOOP:
            return "Nothing to change";
        case player::CMD_INVALID_STATE:
            return "Can't do that right now";
        case player::CMD_SESSION_STOPPED:
            return "Player already stopped, use /play to start again";
        case player::CMD_INVALID_INDEX:
            return "There's no track at that position";
        }

    return player::command_status_str (status);
}

std::string
reply_volume (const float gain)
{
    return "Volume of your tracks set to "
           + std::to_string ((int)std::lround (gain * 100.0f)) + "%";
}

} // woot::util::response
