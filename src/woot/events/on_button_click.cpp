#include "woot/cmds.h"
#include "woot/cmds/loop.h"
#include "woot/cmds/pause.h"
#include "woot/cmds/queue.h"
#include "woot/cmds/resume.h"
#include "woot/cmds/shuffle.h"
#include "woot/cmds/skip.h"
#include "woot/cmds/stop.h"
#include "woot/cmds/volume.h"
#include "woot/events.h"
#include "woot/woot.h"

namespace woot::events
{
using generic_handler_vec
    = std::pair<const char *, void (*) (const dpp::button_click_t &)>;

int
handle_generic_cmd (const dpp::button_click_t &event,
                    const std::string &command_name,
                    const generic_handler_vec *handlers)
{
    if (!handlers)
        return -1;

    void (*handler) (const dpp::button_click_t &) = NULL;

    for (size_t i = 0; handlers[i].first != NULL; i++)
        {
            if (handlers[i].first != command_name)
                {
                    continue;
                }

            handler = handlers[i].second;
            break;
        }

    if (!handler)
        return 1;

    handler (event);

    return 0;
}

inline constexpr const generic_handler_vec player_commands[]
    = { { "p", command::pause::button_run },
        { "r", command::resume::button_run },
        { "n", command::skip::button_run },
        { "s", command::stop::button_run },
        { "l", command::loop::button_run },
        { "h", command::shuffle::button_run },
        { "q", command::queue::button_run },
        { "v", command::volume::button_run },
        { NULL, NULL } };

void
player (const dpp::button_click_t &event,
        const command::button_command_t &cmd)
{
    const std::string param = cmd.param;

    if (param.empty ())
        return;

    if (handle_generic_cmd (event, param, player_commands) != 0)
        {
            fprintf (stderr, "[WARN] player param isn't handled: \"%s\"\n",
                     param.c_str ());
        }
}

inline constexpr const command::button_handlers_map_t button_handlers
    = { { "player", player }, { NULL, NULL } };

void
on_button_click (dpp::cluster *client)
{
    client->on_button_click ([] (const dpp::button_click_t &event) {
        if (get_debug_state ())
            fprintf (stderr, "[BUTTON] %s\n", event.custom_id.c_str ());

        command::handle_button ({ button_handlers, event });
    });
}
} // woot::events
