#ifndef WOOT_COMMAND_NOWPLAYING_H
#define WOOT_COMMAND_NOWPLAYING_H

#include <dpp/dpp.h>
#include <string>

namespace woot::command::nowplaying
{
dpp::slashcommand get_register_obj (const dpp::snowflake &bot_id);

void slash_run (const dpp::slashcommand_t &event);
} // woot::command::nowplaying

#endif // WOOT_COMMAND_NOWPLAYING_H
