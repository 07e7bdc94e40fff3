#ifndef WOOT_H
#define WOOT_H

#include "woot/exception.h"
#include "woot/player.h"
#include "woot/spotify.h"
#include <dpp/dpp.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace woot
{
extern nlohmann::json woot_cfg;

// Main
int run (int argc, const char *argv[]);

/**
 * @brief Get current running state
 */
bool get_running_state ();

/**
 * @brief Set current running state, setting to false will cause program to
 * perform clean up and exit
 *
 * @return int 0 on success
 */
int set_running_state (const bool state);

/**
 * @brief Get current debug state
 */
bool get_debug_state ();

/**
 * @brief Set current debug state, setting to true will enable verbose logging
 *
 * @return int 0 on success
 */
int set_debug_state (const bool state);

/**
 * @brief Load config file into woot_cfg
 *
 * @return int 0 on success, -1 when file can't be opened, -2 on parse error
 */
int load_config (const std::string &config_file);

/**
 * @brief Get config value of key
 *
 * @param key
 * @param default_value
 *
 * @return T
 */
template <typename T>
T
get_config_value (const std::string &key, const T &default_value)
{
    if (woot_cfg.is_null ())
        {
            return default_value;
        }

    if (!woot_cfg.is_object ())
        {
            fprintf (stderr, "[ERROR] Invalid config, config isn't object\n");
            return default_value;
        }

    return woot_cfg.value (key, default_value);
}

/**
 * @brief Build session configuration from loaded config
 */
player::session_config_t get_session_config ();

int cli (dpp::cluster &client, dpp::snowflake bot_id, int argc,
         const char *argv[]);

dpp::cluster *get_client_ptr ();

dpp::snowflake get_bot_id ();

std::string get_bot_token ();

player::registry_ptr_t get_registry_ptr ();

spotify::expander_ptr_t get_spotify_ptr ();

/**
 * @brief Get the voice channel and connected voice members of user in a guild
 *
 * @param guild_id Guild Id the member in
 * @param user_id Target member
 * @return std::pair<dpp::channel*, std::map<dpp::snowflake, dpp::voicestate>>
 * first is NULL when guild is unknown or user isn't in vc
 */
std::pair<dpp::channel *, std::map<dpp::snowflake, dpp::voicestate> >
get_voice_from_gid (const dpp::snowflake &guild_id,
                    const dpp::snowflake &user_id);

/**
 * @brief Format milliseconds to HH:MM:SS, hour omitted when zero
 */
std::string format_duration (uint64_t dur);

/**
 * @brief Create randomly ordered indexes of [0, len)
 */
std::vector<size_t> shuffle_indexes (size_t len);

} // woot

#endif // WOOT_H
