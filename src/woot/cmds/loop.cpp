#include "woot/cmds/loop.h"
#include "woot/cmds.h"
#include "woot/util_response.h"
#include "woot/woot.h"

namespace woot::command::loop
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &bot_id)
{
    return dpp::slashcommand ("loop", "Configure [repeat] mode", bot_id)
        .add_option (dpp::command_option (dpp::co_integer, "mode",
                                          "Set [to this] mode", true)
                         .add_choice (dpp::command_option_choice (
                             "One", (int64_t)player::l_track))
                         .add_choice (dpp::command_option_choice (
                             "All", (int64_t)player::l_queue))
                         .add_choice (dpp::command_option_choice (
                             "Off", (int64_t)player::l_none)));
}

int
run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
     const int64_t mode, std::string &out)
{
    if (mode < player::l_none || mode > player::l_queue)
        {
            out = "Invalid mode";
            return 1;
        }

    player::session_ptr_t session;

    int status = cmd_pre_get_session (guild_id, user_id, session, out);
    if (status != 0)
        return status;

    const player::loop_mode_t l = (player::loop_mode_t)mode;
    const player::command_status_t res = session->set_loop_mode (l);

    if (res == player::CMD_NOOP)
        out = std::string ("Loop mode is already ")
              + player::loop_mode_str (l);
    else
        out = util::response::reply_command_status (
            res, std::string ("Loop mode set to ") + player::loop_mode_str (l));

    return res == player::CMD_OK ? 0 : 1;
}

void
slash_run (const dpp::slashcommand_t &event)
{
    int64_t mode = -1;
    get_inter_param (event, "mode", &mode);

    std::string out;
    int status
        = run (event.command.guild_id, event.command.usr.id, mode, out);

    reply_slash (event, status, out);
}

void
button_run (const dpp::button_click_t &event)
{
    player::registry_ptr_t registry = get_registry_ptr ();
    if (!registry)
        return;

    player::session_ptr_t session = registry->get (event.command.guild_id);

    int64_t next = player::l_track;
    if (session)
        next = ((int64_t)session->snapshot ()->loop_mode + 1)
               % (player::l_queue + 1);

    std::string out;
    int status
        = run (event.command.guild_id, event.command.usr.id, next, out);

    reply_button (event, status, out);
}

} // woot::command::loop
