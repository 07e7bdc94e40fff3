#include "woot/cmds.h"
#include "woot/events.h"
#include "woot/slash.h"

namespace woot::events
{
inline const command::command_handler_t *command_handlers
    = command::get_slash_command_handlers ();

void
on_slashcommand (dpp::cluster *client)
{
    client->on_slashcommand ([] (const dpp::slashcommand_t &event) {
        if (!event.command.guild_id)
            {
                event.reply (dpp::message ("I only work in servers")
                                 .set_flags (dpp::m_ephemeral));
                return;
            }

        const std::string cmd = event.command.get_command_name ();

        auto status
            = command::handle_command ({ cmd, command_handlers, event });

        if (status == command::HANDLE_SLASH_COMMAND_NO_HANDLER)
            {
                event.reply (
                    "Seems like somethin's wrong here, I can't find that "
                    "command anywhere");
            }
    });
}
} // woot::events
