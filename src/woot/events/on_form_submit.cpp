#include "woot/cmds/volume.h"
#include "woot/events.h"
#include "woot/woot.h"
#include <iostream>

namespace woot::events
{
void
on_form_submit (dpp::cluster *client)
{
    client->on_form_submit ([] (const dpp::form_submit_t &event) {
        if (get_debug_state ())
            std::cerr << "[FORM] " << event.custom_id << ' '
                      << event.command.message_id << "\n";

        if (event.custom_id == "volume_modal")
            {
                command::volume::form_run (event);
            }
    });
}
} // woot::events
