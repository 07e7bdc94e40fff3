#include "woot/cmds/nowplaying.h"
#include "woot/cmds.h"
#include "woot/panel.h"
#include "woot/woot.h"

namespace woot::command::nowplaying
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &bot_id)
{
    return dpp::slashcommand ("nowplaying",
                              "Show [currently playing] track with controls",
                              bot_id);
}

void
slash_run (const dpp::slashcommand_t &event)
{
    panel::set_channel (event.command.guild_id, event.command.channel_id);

    event.reply (panel::get_panel_message (event.command.guild_id));
}

} // woot::command::nowplaying
