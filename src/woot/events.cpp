#include "woot/events.h"

namespace woot::events
{
int
load_events (dpp::cluster *client)
{
    on_ready (client);
    on_slashcommand (client);
    on_button_click (client);
    on_select_click (client);
    on_form_submit (client);
    on_voice_state_update (client);

    return 0;
}

} // woot::events
