#ifndef WOOT_COMMAND_H
#define WOOT_COMMAND_H

#include "woot/player.h"
#include <dpp/dpp.h>
#include <string>

namespace woot::command
{
struct command_handler_t
{
    const char *name;
    void (*const handler) (const dpp::slashcommand_t &);
};

struct button_command_t
{
    size_t separator_idx;
    std::string command;
    std::string param;
};

struct button_handler_t
{
    const char *name;
    void (*const handler) (const dpp::button_click_t &,
                           const button_command_t &);
};

using command_handlers_map_t = command_handler_t[];
using button_handlers_map_t = button_handler_t[];

struct handle_command_params_t
{
    const std::string &command_name;
    const command_handler_t *const command_handlers_map;
    const dpp::slashcommand_t &event;
};

struct handle_button_params_t
{
    const button_handler_t *const command_handlers_map;
    const dpp::button_click_t &event;
};

enum handle_command_status_e
{
    HANDLE_SLASH_COMMAND_SUCCESS,
    HANDLE_SLASH_COMMAND_NO_HANDLER,
};

handle_command_status_e handle_command (const handle_command_params_t &params);
handle_command_status_e handle_button (const handle_button_params_t &params);

/**
 * @brief Split custom id of the form "command/param"
 *
 * @return int 0 on success, 1 when command part is empty
 */
int parse_button_id (const std::string &custom_id, button_command_t &bcmd);

template <typename T, typename E>
void
get_inter_param (const E &event, std::string param_name, T *param)
{
    auto p = event.get_parameter (param_name);
    if (p.index ())
        *param = std::get<T> (p);
}

/**
 * @brief Get session of guild for a user wanting to control playback. User
 * must be in the voice channel the session is playing in.
 *
 * @return int 0 on success, 1 with out_reply set when refused, -1 when bot
 * isn't running
 */
int cmd_pre_get_session (const dpp::snowflake &guild_id,
                         const dpp::snowflake &user_id,
                         player::session_ptr_t &out_session,
                         std::string &out_reply);

/**
 * @brief Answer a button interaction. On success the message the button is
 * on gets replaced with fresh panel, otherwise out is shown to the clicker
 * only.
 */
void reply_button (const dpp::button_click_t &event, const int status,
                   const std::string &out);

/**
 * @brief Reply to slash command, ephemeral when status isn't 0
 */
void reply_slash (const dpp::slashcommand_t &event, const int status,
                  const std::string &out);

} // woot::command

#endif // WOOT_COMMAND_H
