#ifndef WOOT_PANEL_H
#define WOOT_PANEL_H

#include "woot/player.h"
#include <dpp/dpp.h>
#include <string>

namespace woot::panel
{

struct button_ids_t
{
    const char *pause;
    const char *resume;
    const char *next;
    const char *stop;
    const char *loop;
    const char *shuffle;
    const char *queue;
    const char *volume;
    const char *jump;
};

inline constexpr const button_ids_t ids
    = { "player/p", "player/r", "player/n", "player/s", "player/l",
        "player/h", "player/q", "player/v", "player/jump" };

// select option label limit
inline constexpr int32_t MAX_LABEL_LENGTH = 100;
inline constexpr int32_t MAX_TITLE_LENGTH = 256;
// entries of the jump select and queue listing
inline constexpr size_t MAX_LISTED_TRACKS = 10;

/**
 * @brief Describe current track with progress, status and requester
 */
std::string render_now_playing (const player::snapshot_t &snap,
                                const long long now);

/**
 * @brief List the first max queued tracks, 1-based
 */
std::string render_queue (const player::snapshot_t &snap,
                          const size_t max = MAX_LISTED_TRACKS);

/**
 * @brief Build panel message with embed, control buttons and jump select
 */
dpp::message get_panel_message (const player::snapshot_t &snap,
                                const long long now);

/**
 * @brief Build panel message for guild from its current session, a plain
 * notice without components when there's no live session
 */
dpp::message get_panel_message (const dpp::snowflake &guild_id);

/**
 * @brief Remember where the panel of guild should be posted
 */
void set_channel (const dpp::snowflake &guild_id,
                  const dpp::snowflake &channel_id);

/**
 * @brief Post panel of guild or edit the existing one
 *
 * @param resend Delete existing panel and post a new one
 */
void send_or_update (const dpp::snowflake &guild_id, const bool resend = false);

/**
 * @brief Delete panel message of guild and forget it
 */
void delete_panel (const dpp::snowflake &guild_id);

/**
 * @brief Send a plain message to the panel channel of guild
 */
void notify (const dpp::snowflake &guild_id, const std::string &content);

/**
 * @brief Session event listener
 */
void handle_event (const player::event_t &event);

/**
 * @brief Edit every posted panel, called periodically
 */
void refresh_all ();

} // woot::panel

#endif // WOOT_PANEL_H
