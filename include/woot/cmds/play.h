#ifndef WOOT_COMMAND_PLAY_H
#define WOOT_COMMAND_PLAY_H

#include "woot/spotify.h"
#include "woot/track.h"
#include <dpp/dpp.h>
#include <string>
#include <vector>

namespace woot::command::play
{
dpp::slashcommand get_register_obj (const dpp::snowflake &bot_id);

/**
 * @brief Join voice channel of user and enqueue tracks in order
 */
int add_tracks (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
                const dpp::snowflake &channel_id,
                const std::vector<player::track_t> &tracks, std::string &out);

/**
 * @brief Join voice channel of user and enqueue query
 */
int run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
         const dpp::snowflake &channel_id, const std::string &query,
         std::string &out);

/**
 * @brief Expand Spotify link into its tracks and enqueue them. Blocks on
 * Spotify Web API.
 */
int run_spotify (const dpp::snowflake &guild_id,
                 const dpp::snowflake &user_id,
                 const dpp::snowflake &channel_id,
                 const spotify::link_t &link, std::string &out);

void slash_run (const dpp::slashcommand_t &event);
} // woot::command::play

#endif // WOOT_COMMAND_PLAY_H
