#include "woot/cmds.h"
#include "woot/panel.h"
#include "woot/woot.h"

namespace woot::command
{

handle_command_status_e
handle_command (const handle_command_params_t &params)
{
    void (*handler) (const dpp::slashcommand_t &) = nullptr;

    for (const command_handler_t *i = params.command_handlers_map;
         i->name != NULL; i++)
        {
            if (params.command_name != i->name)
                continue;

            handler = i->handler;
            break;
        }

    if (!handler)
        return HANDLE_SLASH_COMMAND_NO_HANDLER;

    handler (params.event);

    return HANDLE_SLASH_COMMAND_SUCCESS;
}

int
parse_button_id (const std::string &custom_id, button_command_t &bcmd)
{
    const size_t fsub = custom_id.find ("/");
    const std::string cmd = custom_id.substr (0, fsub);

    bcmd.separator_idx = fsub;
    bcmd.command = cmd;
    bcmd.param.clear ();

    if (fsub != std::string::npos)
        bcmd.param = custom_id.substr (fsub + 1, std::string::npos);

    if (cmd.empty ())
        return 1;

    return 0;
}

handle_command_status_e
handle_button (const handle_button_params_t &params)
{
    button_command_t cmd;

    if (parse_button_id (params.event.custom_id, cmd) != 0)
        return HANDLE_SLASH_COMMAND_NO_HANDLER;

    void (*handler) (const dpp::button_click_t &, const button_command_t &)
        = nullptr;

    for (const button_handler_t *i = params.command_handlers_map;
         i->name != NULL; i++)
        {
            if (cmd.command != i->name)
                continue;

            handler = i->handler;
            break;
        }

    if (!handler)
        return HANDLE_SLASH_COMMAND_NO_HANDLER;

    if (cmd.param.empty ())
        fprintf (stderr, "[WARN] button command \"%s\" have no param\n",
                 cmd.command.c_str ());

    handler (params.event, cmd);

    return HANDLE_SLASH_COMMAND_SUCCESS;
}

int
cmd_pre_get_session (const dpp::snowflake &guild_id,
                     const dpp::snowflake &user_id,
                     player::session_ptr_t &out_session,
                     std::string &out_reply)
{
    player::registry_ptr_t registry = get_registry_ptr ();
    if (!registry)
        return -1;

    player::session_ptr_t session = registry->get (guild_id);
    if (!session)
        {
            out_reply = "I'm not playing anything right now";
            return 1;
        }

    player::snapshot_ptr_t snap = session->snapshot ();
    if (snap->status == player::STATUS_STOPPED)
        {
            out_reply = "I'm not playing anything right now";
            return 1;
        }

    auto uvc = get_voice_from_gid (guild_id, user_id);
    if (!uvc.first)
        {
            out_reply = "You're not in a voice channel";
            return 1;
        }

    if (snap->voice_channel_id && uvc.first->id != snap->voice_channel_id)
        {
            out_reply = "You're not in my voice channel";
            return 1;
        }

    out_session = session;

    return 0;
}

void
reply_button (const dpp::button_click_t &event, const int status,
              const std::string &out)
{
    if (status != 0)
        {
            dpp::message m (out.empty () ? "Can't do that right now" : out);
            m.flags |= dpp::m_ephemeral;

            event.reply (m);
            return;
        }

    panel::set_channel (event.command.guild_id, event.command.channel_id);

    event.reply (dpp::ir_update_message,
                 panel::get_panel_message (event.command.guild_id));
}

void
reply_slash (const dpp::slashcommand_t &event, const int status,
             const std::string &out)
{
    if (out.empty ())
        return;

    dpp::message m (out);
    if (status != 0)
        m.flags |= dpp::m_ephemeral;

    event.reply (m);
}

} // woot::command
