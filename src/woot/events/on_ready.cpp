#include "woot/events.h"
#include <iostream>

namespace woot::events
{
void
on_ready (dpp::cluster *client)
{
    client->on_ready ([] (const dpp::ready_t &event) {
        dpp::discord_client *from = event.from;
        dpp::user me = from->creator->me;

        fprintf (stderr, "[READY] Shard: %d\n", from->shard_id);
        std::cerr << "Logged in as " << me.username << " (" << me.id
                  << ")\n";
    });
}
} // woot::events
