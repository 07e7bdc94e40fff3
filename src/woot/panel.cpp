#include "woot/panel.h"
#include "woot/util.h"
#include "woot/woot.h"
#include <map>
#include <mutex>

namespace woot::panel
{

struct panel_t
{
    dpp::snowflake channel_id;
    dpp::snowflake message_id;
    // message_create in flight
    bool pending;
};

static std::map<dpp::snowflake, panel_t> panels = {};
static std::mutex panels_m;

std::string
render_now_playing (const player::snapshot_t &snap, const long long now)
{
    if (!snap.current_track)
        return "Nothing is playing";

    const player::track_t &t = *snap.current_track;
    const int64_t elapsed = snap.elapsed_ms (now);

    std::string ret = "`" + util::progress_bar (elapsed, t.duration) + "` "
                      + format_duration (elapsed) + " / "
                      + (t.duration ? format_duration (t.duration) : "LIVE");

    ret += std::string ("\n") + player::session_status_str (snap.status)
           + " | Loop: " + player::loop_mode_str (snap.loop_mode);

    if (t.requested_by)
        ret += "\nRequested by <@" + std::to_string (t.requested_by) + ">";

    return ret;
}

std::string
render_queue (const player::snapshot_t &snap, const size_t max)
{
    if (snap.queue.empty ())
        return "Queue is empty";

    std::string ret;
    const size_t siz = snap.queue.size ();

    for (size_t i = 0; i < siz && i < max; i++)
        {
            const player::track_t &t = snap.queue.at (i);

            ret += std::to_string (i + 1) + ". " + t.title;

            if (t.duration)
                ret += " [" + format_duration (t.duration) + "]";

            ret += "\n";
        }

    if (siz > max)
        ret += "and " + std::to_string (siz - max) + " more";
    else
        // trailing newline
        ret.pop_back ();

    return ret;
}

namespace set_component
{
void
play_pause_button (dpp::component &c, const player::snapshot_t &snap)
{
    const bool paused = snap.status == player::STATUS_PAUSED;

    c.set_type (dpp::cot_button)
        .set_style (dpp::cos_primary)
        .set_label (paused ? "Resume" : "Pause")
        .set_id (paused ? ids.resume : ids.pause);

    if (snap.status != player::STATUS_PLAYING && !paused)
        c.set_disabled (true);
}

void
button (dpp::component &c, const std::string &label, const char *id,
        const bool disabled = false)
{
    c.set_type (dpp::cot_button)
        .set_style (dpp::cos_primary)
        .set_label (label)
        .set_id (id);

    if (disabled)
        c.set_disabled (true);
}

void
jump_select (dpp::component &c, const player::snapshot_t &snap)
{
    c.set_type (dpp::cot_selectmenu)
        .set_placeholder ("Jump to track")
        .set_id (ids.jump);

    const size_t siz = snap.queue.size ();
    for (size_t i = 0; i < siz && i < MAX_LISTED_TRACKS; i++)
        {
            const std::string label = util::u8_limit_length (
                std::to_string (i + 1) + ". " + snap.queue.at (i).title,
                MAX_LABEL_LENGTH);

            c.add_select_option (
                dpp::select_option (label, std::to_string (i)));
        }
}
} // set_component

dpp::message
get_panel_message (const player::snapshot_t &snap, const long long now)
{
    dpp::message msg;

    dpp::embed e;
    e.set_description (render_now_playing (snap, now));

    if (snap.current_track)
        {
            const player::track_t &t = *snap.current_track;

            e.set_title (util::u8_limit_length (t.title, MAX_TITLE_LENGTH));

            if (t.stream)
                {
                    if (!t.stream->webpage_url.empty ())
                        e.set_url (t.stream->webpage_url);

                    if (!t.stream->thumbnail.empty ())
                        e.set_thumbnail (t.stream->thumbnail);
                }
        }
    else
        e.set_title ("Nothing playing");

    if (!snap.queue.empty ())
        e.add_field ("Up next", render_queue (snap, 5));

    e.set_footer (std::to_string (snap.queue.size ()) + " track"
                      + (snap.queue.size () == 1 ? "" : "s") + " queued",
                  "");

    msg.add_embed (e);

    const bool no_track = !snap.current_track.has_value ();

    dpp::component play_pause_btn, next_btn, stop_btn, loop_btn, shuffle_btn;
    set_component::play_pause_button (play_pause_btn, snap);
    set_component::button (next_btn, "Skip", ids.next, no_track);
    set_component::button (stop_btn, "Stop", ids.stop);
    set_component::button (loop_btn,
                           std::string ("Loop: ")
                               + player::loop_mode_str (snap.loop_mode),
                           ids.loop);
    set_component::button (shuffle_btn, "Shuffle", ids.shuffle,
                           snap.queue.size () < 2);

    dpp::component first_row;
    first_row.add_component (play_pause_btn)
        .add_component (next_btn)
        .add_component (stop_btn)
        .add_component (loop_btn)
        .add_component (shuffle_btn);

    dpp::component queue_btn, volume_btn;
    set_component::button (queue_btn, "Queue", ids.queue);
    set_component::button (volume_btn, "Volume", ids.volume);

    dpp::component second_row;
    second_row.add_component (queue_btn).add_component (volume_btn);

    msg.add_component (first_row);
    msg.add_component (second_row);

    if (!snap.queue.empty ())
        {
            dpp::component select;
            set_component::jump_select (select, snap);

            dpp::component third_row;
            third_row.add_component (select);
            msg.add_component (third_row);
        }

    return msg;
}

dpp::message
get_panel_message (const dpp::snowflake &guild_id)
{
    player::registry_ptr_t registry = get_registry_ptr ();
    player::session_ptr_t session
        = registry ? registry->get (guild_id) : NULL;

    if (!session)
        return dpp::message ("Nothing is playing");

    player::snapshot_ptr_t snap = session->snapshot ();
    if (snap->status == player::STATUS_STOPPED)
        return dpp::message ("Stopped");

    return get_panel_message (*snap, util::get_current_ts ());
}

void
set_channel (const dpp::snowflake &guild_id, const dpp::snowflake &channel_id)
{
    if (!channel_id)
        return;

    std::lock_guard lk (panels_m);

    auto i = panels.find (guild_id);
    if (i == panels.end ())
        {
            panels.insert_or_assign (guild_id,
                                     panel_t{ channel_id, 0, false });
            return;
        }

    if (i->second.channel_id == channel_id)
        return;

    // panel in the old channel is left as is, next update posts a new one
    i->second.channel_id = channel_id;
    i->second.message_id = 0;
}

void
send_or_update (const dpp::snowflake &guild_id, const bool resend)
{
    dpp::cluster *client = get_client_ptr ();
    if (!client)
        return;

    dpp::snowflake channel_id, old_id;

    {
        std::lock_guard lk (panels_m);

        auto i = panels.find (guild_id);
        if (i == panels.end () || !i->second.channel_id
            || i->second.pending)
            return;

        channel_id = i->second.channel_id;
        old_id = i->second.message_id;

        if (!old_id || resend)
            {
                i->second.pending = true;
                i->second.message_id = 0;
            }
    }

    dpp::message msg = get_panel_message (guild_id);
    msg.channel_id = channel_id;

    if (old_id && !resend)
        {
            msg.id = old_id;

            client->message_edit (
                msg, [guild_id, old_id] (const dpp::confirmation_callback_t &cb) {
                    if (!cb.is_error ())
                        return;

                    util::log_confirmation_error (cb,
                                                  "panel::send_or_update");

                    // probably deleted, post a new one on next event
                    std::lock_guard lk (panels_m);
                    auto i = panels.find (guild_id);
                    if (i != panels.end () && i->second.message_id == old_id)
                        i->second.message_id = 0;
                });

            return;
        }

    if (old_id)
        client->message_delete (
            old_id, channel_id, [] (const dpp::confirmation_callback_t &cb) {
                if (cb.is_error () && get_debug_state ())
                    util::log_confirmation_error (cb, "panel::delete_old");
            });

    client->message_create (
        msg, [guild_id] (const dpp::confirmation_callback_t &cb) {
            std::lock_guard lk (panels_m);

            auto i = panels.find (guild_id);
            if (i != panels.end ())
                i->second.pending = false;

            if (cb.is_error ())
                {
                    util::log_confirmation_error (cb, "panel::send_or_update");
                    return;
                }

            if (i != panels.end ())
                i->second.message_id = cb.get<dpp::message> ().id;
        });
}

void
delete_panel (const dpp::snowflake &guild_id)
{
    dpp::snowflake channel_id, message_id;

    {
        std::lock_guard lk (panels_m);

        auto i = panels.find (guild_id);
        if (i == panels.end ())
            return;

        channel_id = i->second.channel_id;
        message_id = i->second.message_id;

        panels.erase (i);
    }

    dpp::cluster *client = get_client_ptr ();
    if (!client || !message_id)
        return;

    client->message_delete (
        message_id, channel_id, [] (const dpp::confirmation_callback_t &cb) {
            if (cb.is_error ())
                util::log_confirmation_error (cb, "panel::delete_panel");
        });
}

void
notify (const dpp::snowflake &guild_id, const std::string &content)
{
    dpp::cluster *client = get_client_ptr ();
    if (!client || content.empty ())
        return;

    dpp::snowflake channel_id;

    {
        std::lock_guard lk (panels_m);

        auto i = panels.find (guild_id);
        if (i == panels.end ())
            return;

        channel_id = i->second.channel_id;
    }

    if (!channel_id)
        return;

    client->message_create (
        dpp::message (channel_id, content),
        [] (const dpp::confirmation_callback_t &cb) {
            if (cb.is_error ())
                util::log_confirmation_error (cb, "panel::notify");
        });
}

void
handle_event (const player::event_t &event)
{
    if (get_debug_state ())
        fprintf (stderr, "[panel::handle_event] %ld: %d '%s'\n",
                 (uint64_t)event.guild_id, event.type,
                 event.message.c_str ());

    switch (event.type)
        {
        case player::EV_TRACK_STARTED:
            send_or_update (event.guild_id, true);
            break;

        case player::EV_TRACK_FAILED:
            notify (event.guild_id,
                    "Can't play `"
                        + (event.track ? event.track->title
                                       : std::string ("track"))
                        + "`: " + event.message);
            send_or_update (event.guild_id);
            break;

        case player::EV_QUEUE_EMPTY:
            notify (event.guild_id, event.message);
            send_or_update (event.guild_id);
            break;

        case player::EV_SESSION_STOPPED:
            notify (event.guild_id, event.message);
            delete_panel (event.guild_id);
            break;
        }
}

void
refresh_all ()
{
    player::registry_ptr_t registry = get_registry_ptr ();
    if (!registry)
        return;

    std::vector<dpp::snowflake> to_update;
    std::vector<dpp::snowflake> to_delete;

    {
        std::lock_guard lk (panels_m);

        for (const auto &p : panels)
            {
                if (!p.second.message_id || p.second.pending)
                    continue;

                player::session_ptr_t session = registry->get (p.first);
                if (!session)
                    {
                        to_delete.push_back (p.first);
                        continue;
                    }

                // only progress changes on its own
                if (session->snapshot ()->status == player::STATUS_PLAYING)
                    to_update.push_back (p.first);
            }
    }

    for (const dpp::snowflake &guild_id : to_delete)
        delete_panel (guild_id);

    for (const dpp::snowflake &guild_id : to_update)
        send_or_update (guild_id);
}

} // woot::panel
