#include "woot/cmds/queue.h"
#include "woot/cmds.h"
#include "woot/panel.h"
#include "woot/woot.h"

namespace woot::command::queue
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &bot_id)
{
    return dpp::slashcommand ("queue", "Show [current] queue", bot_id);
}

int
run (const dpp::snowflake &guild_id, std::string &out)
{
    player::registry_ptr_t registry = get_registry_ptr ();
    if (!registry)
        return -1;

    player::session_ptr_t session = registry->get (guild_id);
    if (!session)
        {
            out = "Queue is empty";
            return 1;
        }

    player::snapshot_ptr_t snap = session->snapshot ();

    out.clear ();

    if (snap->current_track)
        out += "Now: " + snap->current_track->title + "\n\n";

    out += panel::render_queue (*snap);

    return 0;
}

void
slash_run (const dpp::slashcommand_t &event)
{
    std::string out;
    int status = run (event.command.guild_id, out);

    reply_slash (event, status, out);
}

void
button_run (const dpp::button_click_t &event)
{
    std::string out;
    run (event.command.guild_id, out);

    dpp::message m (out);
    m.flags |= dpp::m_ephemeral;

    event.reply (m);
}

} // woot::command::queue
