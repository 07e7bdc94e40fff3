#include "woot/cmds/stop.h"
#include "woot/cmds.h"
#include "woot/panel.h"
#include "woot/woot.h"

namespace woot::command::stop
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &bot_id)
{
    return dpp::slashcommand (
        "stop", "Stop playback, clear the queue and leave [voice channel]",
        bot_id);
}

dpp::slashcommand
get_leave_register_obj (const dpp::snowflake &bot_id)
{
    return dpp::slashcommand ("leave", "Leave [voice channel]", bot_id);
}

int
run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
     std::string &out)
{
    player::session_ptr_t session;

    int status = cmd_pre_get_session (guild_id, user_id, session, out);
    if (status != 0)
        return status;

    player::registry_ptr_t registry = get_registry_ptr ();
    if (!registry)
        return -1;

    // stopped session emits session_stopped which takes the panel down
    if (!registry->remove (guild_id))
        {
            out = "I'm not playing anything right now";
            return 1;
        }

    out = "Stopped";

    return 0;
}

void
slash_run (const dpp::slashcommand_t &event)
{
    std::string out;
    int status = run (event.command.guild_id, event.command.usr.id, out);

    reply_slash (event, status, out);
}

void
button_run (const dpp::button_click_t &event)
{
    std::string out;
    int status = run (event.command.guild_id, event.command.usr.id, out);

    reply_button (event, status, out);
}

} // woot::command::stop
