#ifndef WOOT_COMMAND_LOOP_H
#define WOOT_COMMAND_LOOP_H

#include <dpp/dpp.h>
#include <string>

namespace woot::command::loop
{
dpp::slashcommand get_register_obj (const dpp::snowflake &bot_id);

int run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
         const int64_t mode, std::string &out);

void slash_run (const dpp::slashcommand_t &event);

/**
 * @brief Cycle loop mode Off, One, All
 */
void button_run (const dpp::button_click_t &event);
} // woot::command::loop

#endif // WOOT_COMMAND_LOOP_H
