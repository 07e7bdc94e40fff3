#include "woot/cmds/pause.h"
#include "woot/cmds.h"
#include "woot/util_response.h"
#include "woot/woot.h"

namespace woot::command::pause
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &bot_id)
{
    return dpp::slashcommand ("pause", "Pause [currently playing] track",
                              bot_id);
}

int
run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
     std::string &out)
{
    player::session_ptr_t session;

    int status = cmd_pre_get_session (guild_id, user_id, session, out);
    if (status != 0)
        return status;

    const player::command_status_t res = session->pause ();

    switch (res)
        {
        case player::CMD_NOOP:
            out = "Already paused";
            break;
        case player::CMD_INVALID_STATE:
            out = "I'm not playing anything right now";
            break;
        default:
            out = util::response::reply_command_status (res, "Paused");
        }

    return res == player::CMD_OK ? 0 : 1;
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

} // woot::command::pause
