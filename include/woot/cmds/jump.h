#ifndef WOOT_COMMAND_JUMP_H
#define WOOT_COMMAND_JUMP_H

#include <dpp/dpp.h>
#include <string>

namespace woot::command::jump
{
dpp::slashcommand get_register_obj (const dpp::snowflake &bot_id);

/**
 * @brief Jump to 0-based queue index
 */
int run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
         const int64_t index, std::string &out);

void slash_run (const dpp::slashcommand_t &event);

void select_run (const dpp::select_click_t &event);
} // woot::command::jump

#endif // WOOT_COMMAND_JUMP_H
