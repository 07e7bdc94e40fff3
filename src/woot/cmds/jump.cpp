#include "woot/cmds/jump.h"
#include "woot/cmds.h"
#include "woot/panel.h"
#include "woot/util.h"
#include "woot/util_response.h"
#include "woot/woot.h"

namespace woot::command::jump
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &bot_id)
{
    return dpp::slashcommand ("jump", "Skip [straight] to a queued track",
                              bot_id)
        .add_option (dpp::command_option (dpp::co_integer, "position",
                                          "Position [in the queue]", true)
                         .set_min_value (1));
}

int
run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
     const int64_t index, std::string &out)
{
    player::session_ptr_t session;

    int status = cmd_pre_get_session (guild_id, user_id, session, out);
    if (status != 0)
        return status;

    if (index < 0)
        {
            out = util::response::reply_command_status (
                player::CMD_INVALID_INDEX, "");
            return 1;
        }

    player::snapshot_ptr_t snap = session->snapshot ();
    const std::string title = (size_t)index < snap->queue.size ()
                                  ? snap->queue.at (index).title
                                  : "";

    const player::command_status_t res = session->jump ((size_t)index);

    out = util::response::reply_command_status (
        res, "Jumped to `" + title + "`");

    return res == player::CMD_OK ? 0 : 1;
}

void
slash_run (const dpp::slashcommand_t &event)
{
    int64_t position = 0;
    get_inter_param (event, "position", &position);

    std::string out;
    int status = run (event.command.guild_id, event.command.usr.id,
                      position - 1, out);

    reply_slash (event, status, out);
}

void
select_run (const dpp::select_click_t &event)
{
    if (event.values.empty ()
        || util::valid_number (event.values.at (0)) != 0)
        {
            fprintf (stderr, "[command::jump::select_run WARN] Invalid "
                             "select value\n");
            return;
        }

    const int64_t index = std::stoll (event.values.at (0));

    std::string out;
    int status = run (event.command.guild_id, event.command.usr.id, index,
                      out);

    if (status != 0)
        {
            dpp::message m (out);
            m.flags |= dpp::m_ephemeral;

            event.reply (m);
            return;
        }

    event.reply (dpp::ir_update_message,
                 panel::get_panel_message (event.command.guild_id));
}

} // woot::command::jump
