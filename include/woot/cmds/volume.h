#ifndef WOOT_COMMAND_VOLUME_H
#define WOOT_COMMAND_VOLUME_H

#include <dpp/dpp.h>
#include <string>

namespace woot::command::volume
{
dpp::slashcommand get_register_obj (const dpp::snowflake &bot_id);

int run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
         const int64_t percentage, std::string &out);

void slash_run (const dpp::slashcommand_t &event);

dpp::interaction_modal_response get_modal ();

void button_run (const dpp::button_click_t &event);

void form_run (const dpp::form_submit_t &event);
} // woot::command::volume

#endif // WOOT_COMMAND_VOLUME_H
