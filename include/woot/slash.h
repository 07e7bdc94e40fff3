#ifndef WOOT_SLASH_H
#define WOOT_SLASH_H

#include "woot/cmds.h"
#include <dpp/dpp.h>
#include <vector>

namespace woot
{
namespace command
{
/**
 * @brief Get all application command object to register
 *
 * @param bot_id
 * @return std::vector<dpp::slashcommand>
 */
std::vector<dpp::slashcommand> get_all (const dpp::snowflake &bot_id);

/**
 * @brief Get slash command handlers map
 */
const command_handler_t *get_slash_command_handlers ();
} // command
} // woot

#endif // WOOT_SLASH_H
