#include "woot/cmds/remove.h"
#include "woot/cmds.h"
#include "woot/util_response.h"
#include "woot/woot.h"

namespace woot::command::remove
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &bot_id)
{
    return dpp::slashcommand ("remove", "Remove [a track] from the queue",
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

    player::track_t removed{};
    const player::command_status_t res
        = session->remove ((size_t)index, &removed);

    out = util::response::reply_command_status (
        res, "Removed `" + removed.title + "` from the queue");

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

} // woot::command::remove
