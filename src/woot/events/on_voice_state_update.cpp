#include "woot/events.h"
#include "woot/voice_driver.h"
#include "woot/woot.h"

namespace woot::events
{
void
on_voice_state_update (dpp::cluster *client)
{
    client->on_voice_state_update (
        [] (const dpp::voice_state_update_t &event) {
            // only our own voice state matters, humans leaving don't
            // change anything
            if (event.state.user_id != get_bot_id ())
                return;

            auto registry = get_registry_ptr ();
            if (!registry)
                return;

            const dpp::snowflake guild_id = event.state.guild_id;

            if (get_debug_state ())
                fprintf (stderr, "[events::on_voice_state_update] %ld: %ld\n",
                         (uint64_t)guild_id,
                         (uint64_t)event.state.channel_id);

            if (!event.state.channel_id)
                {
                    if (player::DppTransmissionDriver::is_reconnecting (
                            guild_id))
                        return;

                    registry->handle_voice_disconnected (guild_id);
                    return;
                }

            registry->handle_voice_moved (guild_id, event.state.channel_id);
        });
}
} // woot::events
