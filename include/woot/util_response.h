#ifndef WOOT_UTIL_RESPONSE_H
#define WOOT_UTIL_RESPONSE_H

#include "woot/player.h"
#include <dpp/dpp.h>
#include <string>

namespace woot::util::response
{

/**
 * @brief Describe 1-based queue position, 0 or less means end of queue
 */
std::string str_queue_position (const int64_t &position);

std::string reply_added_track (const std::string &title,
                               const int64_t &position);

std::string reply_loading_track (const std::string &title);

/**
 * @brief Reply for a link expanded into several tracks
 *
 * @param first_playing Whether the first of them started right away
 */
std::string reply_added_tracks (const size_t count, const bool first_playing);

std::string str_mention_user (const dpp::snowflake &user_id);

/**
 * @brief Reply for a command result, ok_reply when status is CMD_OK
 */
std::string reply_command_status (const player::command_status_t status,
                                  const std::string &ok_reply);

std::string reply_volume (const float gain);

} // woot::util::response

#endif // WOOT_UTIL_RESPONSE_H
