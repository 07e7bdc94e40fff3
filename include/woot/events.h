#ifndef WOOT_EVENTS_H
#define WOOT_EVENTS_H

#include <dpp/dpp.h>

namespace woot::events
{
/**
 * @brief Attach every gateway event handler to client
 */
int load_events (dpp::cluster *client);

void on_ready (dpp::cluster *client);

void on_slashcommand (dpp::cluster *client);

void on_button_click (dpp::cluster *client);

void on_select_click (dpp::cluster *client);

void on_form_submit (dpp::cluster *client);

void on_voice_state_update (dpp::cluster *client);

} // woot::events

#endif // WOOT_EVENTS_H
