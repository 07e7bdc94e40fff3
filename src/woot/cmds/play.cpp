#include "woot/cmds/play.h"
#include "woot/cmds.h"
#include "woot/panel.h"
#include "woot/thread_manager.h"
#include "woot/util_response.h"
#include "woot/woot.h"

namespace woot::command::play
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &bot_id)
{
    return dpp::slashcommand ("play", "Play [a track]", bot_id)
        .add_option (dpp::command_option (dpp::co_string, "query",
                                          "Track [name, url or Spotify link] "
                                          "to play",
                                          true)
                         .set_max_length (1000));
}

int
add_tracks (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
            const dpp::snowflake &channel_id,
            const std::vector<player::track_t> &tracks, std::string &out)
{
    player::registry_ptr_t registry = get_registry_ptr ();
    if (!registry)
        return -1;

    if (tracks.empty ())
        {
            out = "Nothing to play";
            return 1;
        }

    auto uvc = get_voice_from_gid (guild_id, user_id);
    if (!uvc.first)
        {
            out = "You're not in a voice channel";
            return 1;
        }

    panel::set_channel (guild_id, channel_id);

    player::session_ptr_t session;
    player::command_status_t res = player::CMD_SESSION_STOPPED;
    size_t added = 0;

    // the session we got may be stopped by sweep or a voice disconnect before
    // we reach it, a fresh one takes the rest on the second try
    for (int attempt = 0; attempt < 2; attempt++)
        {
            session = registry->get_or_create (guild_id);

            res = session->join (uvc.first->id);
            if (res == player::CMD_SESSION_STOPPED)
                continue;

            if (res != player::CMD_OK && res != player::CMD_NOOP)
                {
                    out = "I can't join your voice channel";
                    return 1;
                }

            while (added < tracks.size ())
                {
                    res = session->enqueue (tracks.at (added));
                    if (res != player::CMD_OK)
                        break;

                    added++;
                }

            if (res != player::CMD_SESSION_STOPPED)
                break;
        }

    if (!added)
        {
            out = util::response::reply_command_status (res, "");
            return 1;
        }

    if (added < tracks.size ())
        fprintf (stderr,
                 "[command::play::add_tracks ERROR] %ld: Only %ld of %ld "
                 "tracks added: %s\n",
                 (uint64_t)guild_id, added, tracks.size (),
                 player::command_status_str (res));

    player::snapshot_ptr_t snap = session->snapshot ();

    const player::track_t &first = tracks.front ();
    const bool first_playing
        = snap->current_track && snap->current_track->id == first.id;

    if (added > 1)
        out = util::response::reply_added_tracks (added, first_playing);
    else if (first_playing)
        {
            out = util::response::reply_loading_track (first.title);
            return 0;
        }
    else
        out = util::response::reply_added_track (
            first.title, (int64_t)snap->queue.size ());

    // panel only shows queue changes on update
    panel::send_or_update (guild_id);

    return 0;
}

int
run (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
     const dpp::snowflake &channel_id, const std::string &query,
     std::string &out)
{
    if (query.empty ())
        {
            out = "Provide a track name or url to play";
            return 1;
        }

    return add_tracks (guild_id, user_id, channel_id,
                       { player::create_track (query, user_id) }, out);
}

int
run_spotify (const dpp::snowflake &guild_id, const dpp::snowflake &user_id,
             const dpp::snowflake &channel_id, const spotify::link_t &link,
             std::string &out)
{
    spotify::expander_ptr_t expander = get_spotify_ptr ();
    if (!expander)
        return -1;

    std::vector<player::track_t> tracks;

    try
        {
            tracks = expander->expand (link, user_id);
        }
    catch (const spotify::api_error &e)
        {
            out = e.what ();
            return 1;
        }

    return add_tracks (guild_id, user_id, channel_id, tracks, out);
}

void
slash_run (const dpp::slashcommand_t &event)
{
    std::string query;
    get_inter_param (event, "query", &query);

    const spotify::link_t link = spotify::parse_link (query);

    if (link.kind == spotify::LINK_NONE)
        {
            std::string out;
            int status = run (event.command.guild_id, event.command.usr.id,
                              event.command.channel_id, query, out);

            reply_slash (event, status, out);
            return;
        }

    // refuse early, expansion can take a while
    if (!get_voice_from_gid (event.command.guild_id, event.command.usr.id)
             .first)
        {
            reply_slash (event, 1, "You're not in a voice channel");
            return;
        }

    spotify::expander_ptr_t expander = get_spotify_ptr ();
    if (!expander || !expander->is_configured ())
        {
            reply_slash (event, 1,
                         "Spotify links aren't available, ask the bot owner "
                         "to configure Spotify credentials");
            return;
        }

    event.thinking ();

    std::thread rt ([event, link] () {
        thread_manager::DoneSetter tmds;

        std::string out;
        run_spotify (event.command.guild_id, event.command.usr.id,
                     event.command.channel_id, link, out);

        if (!out.empty ())
            event.edit_response (out);
    });

    thread_manager::dispatch (rt);
}

} // woot::command::play
