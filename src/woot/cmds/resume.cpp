#include "woot/cmds/resume.h"
#include "woot/cmds.h"
#include "woot/util_response.h"
#include "woot/woot.h"

namespace woot::command::resume
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &bot_id)
{
    return dpp::slashcommand ("resume", "Resume [paused] playback", bot_id);
}

int
run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
     std::string &out)
{
    player::session_ptr_t session;

    int status = cmd_pre_get_session (guild_id, user_id, session, out);
    if (status != 0)
        return status;

    const player::command_status_t res = session->resume ();

    switch (res)
        {
        case player::CMD_NOOP:
            out = "Already playing";
            break;
        case player::CMD_INVALID_STATE:
            out = "Nothing is paused";
            break;
        default:
            out = util::response::reply_command_status (res, "Resumed");
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

} // woot::command::resume
