#ifndef WOOT_COMMAND_REMOVE_H
#define WOOT_COMMAND_REMOVE_H

#include <dpp/dpp.h>
#include <string>

namespace woot::command::remove
{
dpp::slashcommand get_register_obj (const dpp::snowflake &bot_id);

int run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
         const int64_t index, std::string &out);

void slash_run (const dpp::slashcommand_t &event);
} // woot::command::remove

#endif // WOOT_COMMAND_REMOVE_H
