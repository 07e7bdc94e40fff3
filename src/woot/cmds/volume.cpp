#include "woot/cmds/volume.h"
#include "woot/cmds.h"
#include "woot/util.h"
#include "woot/util_response.h"
#include "woot/woot.h"

#define MIN_PERCENTAGE 0
#define MIN_PERCENTAGE_STR "0"

#define MAX_PERCENTAGE 200
#define MAX_PERCENTAGE_STR "200"

namespace woot::command::volume
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &bot_id)
{
    return dpp::slashcommand ("volume", "Set volume [of your tracks]", bot_id)
        .add_option (dpp::command_option (
                         dpp::co_integer, "percentage",
                         "Volume percentage [to set]. <" MIN_PERCENTAGE_STR
                         "-" MAX_PERCENTAGE_STR ">",
                         true)
                         .set_min_value (MIN_PERCENTAGE)
                         .set_max_value (MAX_PERCENTAGE));
}

int
run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
     const int64_t percentage, std::string &out)
{
    if (percentage < MIN_PERCENTAGE || percentage > MAX_PERCENTAGE)
        {
            out = "Invalid `percentage` argument. Must be "
                  "between " MIN_PERCENTAGE_STR "% "
                  "and " MAX_PERCENTAGE_STR "% inclusive";
            return 1;
        }

    player::session_ptr_t session;

    int status = cmd_pre_get_session (guild_id, user_id, session, out);
    if (status != 0)
        return status;

    float effective = 0.0f;
    const player::command_status_t res
        = session->set_volume (user_id, (float)percentage / 100.0f, &effective);

    if (res == player::CMD_NOOP)
        out = util::response::reply_volume (effective);
    else
        out = util::response::reply_command_status (
            res, util::response::reply_volume (effective));

    return res == player::CMD_OK || res == player::CMD_NOOP ? 0 : 1;
}

void
slash_run (const dpp::slashcommand_t &event)
{
    int64_t v_arg = -1;
    get_inter_param (event, "percentage", &v_arg);

    std::string out;
    int status
        = run (event.command.guild_id, event.command.usr.id, v_arg, out);

    reply_slash (event, status, out);
}

dpp::interaction_modal_response
get_modal ()
{
    dpp::interaction_modal_response modal ("volume_modal", "Set volume");

    modal.add_component (
        dpp::component ()
            .set_label ("Percentage <" MIN_PERCENTAGE_STR
                        "-" MAX_PERCENTAGE_STR ">")
            .set_id ("percentage")
            .set_type (dpp::cot_text)
            .set_placeholder ("100")
            .set_min_length (1)
            .set_max_length (3)
            .set_text_style (dpp::text_short));

    return modal;
}

void
button_run (const dpp::button_click_t &event)
{
    event.dialog (get_modal (), [] (const dpp::confirmation_callback_t &res) {
        if (res.is_error ())
            util::log_confirmation_error (res, "command::volume::button_run");
    });
}

void
form_run (const dpp::form_submit_t &event)
{
    if (event.components.empty ()
        || event.components.at (0).components.empty ())
        {
            fprintf (stderr, "[command::volume::form_run WARN] Form "
                             "`volume_modal` doesn't contain "
                             "any components row\n");
            return;
        }

    const dpp::component &comp = event.components.at (0).components.at (0);

    std::string out;
    int status = 1;

    if (!std::holds_alternative<std::string> (comp.value))
        out = "Invalid percentage";
    else
        {
            const std::string q = std::get<std::string> (comp.value);

            if (util::valid_number (q) != 0)
                out = "Invalid percentage, numbers only";
            else
                status = run (event.command.guild_id, event.command.usr.id,
                              std::stoll (q), out);
        }

    dpp::message m (out);
    if (status != 0)
        m.flags |= dpp::m_ephemeral;

    event.reply (m);
}

} // woot::command::volume
