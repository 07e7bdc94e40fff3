#ifndef WOOT_COMMAND_PAUSE_H
#define WOOT_COMMAND_PAUSE_H

#include <dpp/dpp.h>
#include <string>

namespace woot::command::pause
{
dpp::slashcommand get_register_obj (const dpp::snowflake &bot_id);

int run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
         std::string &out);

void slash_run (const dpp::slashcommand_t &event);

void button_run (const dpp::button_click_t &event);
} // woot::command::pause

#endif // WOOT_COMMAND_PAUSE_H
