#include "woot/cmds/jump.h"
#include "woot/events.h"
#include "woot/panel.h"
#include "woot/woot.h"

namespace woot::events
{
void
on_select_click (dpp::cluster *client)
{
    client->on_select_click ([] (const dpp::select_click_t &event) {
        if (get_debug_state ())
            fprintf (stderr, "[SELECT] %s\n", event.custom_id.c_str ());

        if (event.custom_id == panel::ids.jump)
            {
                command::jump::select_run (event);
            }
        else
            {
                fprintf (stderr, "[WARN] select isn't handled: \"%s\"\n",
                         event.custom_id.c_str ());
            }
    });
}
} // woot::events
