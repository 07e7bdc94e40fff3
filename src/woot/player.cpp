#include "woot/player.h"
#include "woot/thread_manager.h"
#include "woot/util.h"
#include "woot/woot.h"
#include <cmath>
#include <stdio.h>

namespace woot::player
{

const char *
loop_mode_str (const loop_mode_t mode)
{
    switch (mode)
        {
        case l_none:
            return "Off";
        case l_track:
            return "One";
        case l_queue:
            return "All";
        }

    return "Unknown";
}

const char *
session_status_str (const session_status_t status)
{
    switch (status)
        {
        case STATUS_IDLE:
            return "Idle";
        case STATUS_BUFFERING:
            return "Buffering";
        case STATUS_PLAYING:
            return "Playing";
        case STATUS_PAUSED:
            return "Paused";
        case STATUS_STOPPED:
            return "Stopped";
        }

    return "Unknown";
}

const char *
command_status_str (const command_status_t status)
{
    switch (status)
        {
        case CMD_OK:
            return "OK";
        case CMD_NOOP:
            return "Nothing changed";
        case CMD_INVALID_STATE:
            return "Not possible right now";
        case CMD_SESSION_STOPPED:
            return "Session already stopped";
        case CMD_INVALID_INDEX:
            return "Invalid position";
        }

    return "Unknown";
}

int64_t
snapshot_t::elapsed_ms (const long long now) const
{
    if (!current_track || !started_at)
        return 0;

    const long long until = paused_at ? paused_at : now;
    const long long elapsed = until - started_at - paused_total;

    return elapsed > 0 ? util::ns_to_ms (elapsed) : 0;
}

Session::Session (const dpp::snowflake &guild_id,
                  const session_config_t &config, resolver_ptr_t resolver,
                  driver_ptr_t driver, event_listener_t listener)
    : guild_id (guild_id), config (config), resolver (resolver),
      driver (driver), listener (listener), loop_mode (l_none),
      status (STATUS_IDLE), voice_channel_id (0), voice_confirmed (false),
      started_at (0),
      paused_at (0), paused_total (0),
      idle_since (util::get_current_ts ()), consecutive_failures (0),
      generation (0)
{
    std::lock_guard lk (t_mutex);
    publish_snapshot ();
}

Session::~Session ()
{
    if (get_debug_state ())
        fprintf (stderr, "[Session::~Session] Deleting session: %ld\n",
                 (uint64_t)guild_id);
}

const dpp::snowflake &
Session::get_guild_id () const
{
    return guild_id;
}

// ================= LOCKED HELPERS =================

void
Session::publish_snapshot ()
{
    auto snap = std::make_shared<snapshot_t> ();

    snap->guild_id = guild_id;
    snap->status = status;
    snap->loop_mode = loop_mode;
    snap->current_track = current_track;
    snap->queue.assign (queue.begin (), queue.end ());
    snap->volumes = volumes;
    snap->voice_channel_id = voice_channel_id;
    snap->started_at = started_at;
    snap->paused_at = paused_at;
    snap->paused_total = paused_total;
    snap->idle_since = idle_since;

    std::lock_guard lk (snapshot_m);
    published = snap;
}

float
Session::clamp_volume (const float gain) const
{
    float g = std::isnan (gain) ? config.default_volume : gain;

    if (g < config.volume_min)
        g = config.volume_min;
    else if (g > config.volume_max)
        g = config.volume_max;

    return g;
}

float
Session::get_gain (const dpp::snowflake &user_id) const
{
    auto i = volumes.find (user_id);
    if (i == volumes.end ())
        return clamp_volume (config.default_volume);

    return i->second;
}

void
Session::cancel_send ()
{
    if (send_token)
        {
            send_token->cancel ();
            send_token = nullptr;
        }
}

void
Session::start_current (std::vector<event_t> &events)
{
    if (!current_track)
        {
            set_idle ("", events);
            return;
        }

    generation++;
    cancel_send ();

    started_at = 0;
    paused_at = 0;
    paused_total = 0;

    if (current_track->is_resolved ()
        && current_track->stream->is_valid (util::get_current_ts (),
                                            config.stream_ttl_ms))
        {
            start_send (events);
            return;
        }

    status = STATUS_BUFFERING;
    launch_resolve (generation, *current_track);
}

void
Session::start_send (std::vector<event_t> &events)
{
    status = STATUS_PLAYING;
    started_at = util::get_current_ts ();
    paused_at = 0;
    paused_total = 0;

    send_token = std::make_shared<cancel_token_t> ();

    driver->set_paused (false);
    driver->set_gain (get_gain (current_track->requested_by));

    events.push_back ({ EV_TRACK_STARTED, guild_id, current_track,
                        "Now playing: " + current_track->title });

    launch_send (generation, *current_track, send_token);
}

void
Session::advance (const bool skipped, std::vector<event_t> &events)
{
    if (!current_track)
        {
            set_idle ("", events);
            return;
        }

    track_t finished = *current_track;
    current_track.reset ();

    if (!skipped && loop_mode == l_track)
        {
            current_track = finished;
            start_current (events);
            return;
        }

    if (loop_mode == l_queue || (skipped && loop_mode == l_track))
        {
            // a lone skipped track would come right back, drop it instead
            if (!skipped || !queue.empty ())
                queue.push_back (finished);
        }

    if (queue.empty ())
        {
            set_idle ("Queue finished", events);
            return;
        }

    current_track = queue.front ();
    queue.pop_front ();

    start_current (events);
}

void
Session::handle_failure (const track_t &failed, const std::string &reason,
                         std::vector<event_t> &events)
{
    consecutive_failures++;

    fprintf (stderr, "[Session::handle_failure] %ld: '%s' failed (%d/%d): %s\n",
             (uint64_t)guild_id, failed.title.c_str (), consecutive_failures,
             config.max_consecutive_failures, reason.c_str ());

    events.push_back ({ EV_TRACK_FAILED, guild_id, failed, reason });

    current_track.reset ();

    if (consecutive_failures >= config.max_consecutive_failures)
        {
            queue.clear ();
            set_idle ("Too many consecutive failures, clearing the queue",
                      events);
            return;
        }

    if (queue.empty ())
        {
            set_idle ("Queue finished", events);
            return;
        }

    current_track = queue.front ();
    queue.pop_front ();

    start_current (events);
}

void
Session::set_idle (const std::string &message, std::vector<event_t> &events)
{
    generation++;
    cancel_send ();

    current_track.reset ();
    queue.clear ();
    status = STATUS_IDLE;
    consecutive_failures = 0;
    started_at = 0;
    paused_at = 0;
    paused_total = 0;
    idle_since = util::get_current_ts ();

    events.push_back ({ EV_QUEUE_EMPTY, guild_id, std::nullopt, message });
}

void
Session::stop_locked (std::vector<event_t> &events)
{
    generation++;
    cancel_send ();

    queue.clear ();
    current_track.reset ();
    status = STATUS_STOPPED;
    started_at = 0;
    paused_at = 0;
    paused_total = 0;

    driver->disconnect ();

    events.push_back ({ EV_SESSION_STOPPED, guild_id, std::nullopt, "" });
}

// ================= BACKGROUND TASKS =================

void
Session::launch_resolve (const uint64_t gen, const track_t &request)
{
    auto self = shared_from_this ();

    std::thread t ([self, gen, request] () {
        thread_manager::DoneSetter tmds;

        try
            {
                track_t resolved = self->resolver->resolve (request.query);
                self->handle_resolved (gen,
                                       merge_resolution (request, resolved));
            }
        catch (const resolution_error &e)
            {
                self->handle_resolve_failed (
                    gen, request,
                    std::string (resolution_error_kind_str (e.kind ())) + ": "
                        + e.what ());
            }
        catch (const std::exception &e)
            {
                self->handle_resolve_failed (
                    gen, request,
                    std::string (resolution_error_kind_str (
                        RESOLUTION_EXTERNAL_TOOL_FAILURE))
                        + ": " + e.what ());
            }
    });

    thread_manager::dispatch (t);
}

void
Session::launch_send (const uint64_t gen, const track_t &track,
                      const cancel_token_ptr_t &token)
{
    auto self = shared_from_this ();
    driver_ptr_t drv = driver;

    std::thread t ([self, drv, gen, track, token] () {
        thread_manager::DoneSetter tmds;

        stream_error_t result = drv->send (*track.stream, token);

        self->handle_send_done (gen, track, result);
    });

    thread_manager::dispatch (t);
}

void
Session::handle_resolved (const uint64_t gen, const track_t &resolved)
{
    std::vector<event_t> events;

    {
        std::lock_guard lk (t_mutex);

        if (gen != generation || status != STATUS_BUFFERING)
            {
                if (get_debug_state ())
                    fprintf (stderr,
                             "[Session::handle_resolved] %ld: Discarding "
                             "stale resolution of '%s'\n",
                             (uint64_t)guild_id, resolved.query.c_str ());
                return;
            }

        current_track = resolved;
        start_send (events);

        publish_snapshot ();
    }

    emit (events);
}

void
Session::handle_resolve_failed (const uint64_t gen, const track_t &request,
                                const std::string &reason)
{
    std::vector<event_t> events;

    {
        std::lock_guard lk (t_mutex);

        if (gen != generation || status != STATUS_BUFFERING)
            return;

        handle_failure (current_track ? *current_track : request, reason,
                        events);

        publish_snapshot ();
    }

    emit (events);
}

void
Session::handle_send_done (const uint64_t gen, const track_t &track,
                           const stream_error_t result)
{
    std::vector<event_t> events;

    {
        std::lock_guard lk (t_mutex);

        // skipped, stopped or restarted while sending
        if (gen != generation)
            return;

        if (status != STATUS_PLAYING && status != STATUS_PAUSED)
            return;

        send_token = nullptr;

        switch (result)
            {
            case STREAM_OK:
                consecutive_failures = 0;
                advance (false, events);
                break;
            case STREAM_CANCELLED:
                // cancellation always bumps generation first, nothing to do
                return;
            default:
                handle_failure (track, stream_error_str (result), events);
                break;
            }

        publish_snapshot ();
    }

    emit (events);
}

void
Session::emit (const std::vector<event_t> &events)
{
    if (!listener)
        return;

    for (const event_t &e : events)
        {
            listener (e);
        }
}

// ================= COMMANDS =================

command_status_t
Session::enqueue (const track_t &track)
{
    std::vector<event_t> events;

    {
        std::lock_guard lk (t_mutex);

        if (status == STATUS_STOPPED)
            return CMD_SESSION_STOPPED;

        if (status == STATUS_IDLE)
            {
                current_track = track;
                start_current (events);
            }
        else
            queue.push_back (track);

        publish_snapshot ();
    }

    emit (events);

    return CMD_OK;
}

command_status_t
Session::skip ()
{
    std::vector<event_t> events;

    {
        std::lock_guard lk (t_mutex);

        if (status == STATUS_STOPPED)
            return CMD_SESSION_STOPPED;

        if (!current_track)
            return CMD_INVALID_STATE;

        generation++;
        cancel_send ();

        advance (true, events);

        publish_snapshot ();
    }

    emit (events);

    return CMD_OK;
}

command_status_t
Session::pause ()
{
    std::lock_guard lk (t_mutex);

    switch (status)
        {
        case STATUS_STOPPED:
            return CMD_SESSION_STOPPED;
        case STATUS_PAUSED:
            return CMD_NOOP;
        case STATUS_PLAYING:
            break;
        default:
            return CMD_INVALID_STATE;
        }

    driver->set_paused (true);
    status = STATUS_PAUSED;
    paused_at = util::get_current_ts ();

    publish_snapshot ();

    return CMD_OK;
}

command_status_t
Session::resume ()
{
    std::lock_guard lk (t_mutex);

    switch (status)
        {
        case STATUS_STOPPED:
            return CMD_SESSION_STOPPED;
        case STATUS_PLAYING:
            return CMD_NOOP;
        case STATUS_PAUSED:
            break;
        default:
            return CMD_INVALID_STATE;
        }

    driver->set_paused (false);
    status = STATUS_PLAYING;

    if (paused_at)
        {
            paused_total += util::get_current_ts () - paused_at;
            paused_at = 0;
        }

    publish_snapshot ();

    return CMD_OK;
}

command_status_t
Session::stop ()
{
    std::vector<event_t> events;

    {
        std::lock_guard lk (t_mutex);

        if (status == STATUS_STOPPED)
            return CMD_NOOP;

        stop_locked (events);

        publish_snapshot ();
    }

    emit (events);

    return CMD_OK;
}

bool
Session::shutdown ()
{
    std::lock_guard lk (t_mutex);

    if (status == STATUS_STOPPED)
        return false;

    std::vector<event_t> events;
    stop_locked (events);

    publish_snapshot ();

    return true;
}

command_status_t
Session::set_loop_mode (const loop_mode_t mode)
{
    std::lock_guard lk (t_mutex);

    if (status == STATUS_STOPPED)
        return CMD_SESSION_STOPPED;

    if (loop_mode == mode)
        return CMD_NOOP;

    loop_mode = mode;

    publish_snapshot ();

    return CMD_OK;
}

command_status_t
Session::set_volume (const dpp::snowflake &user_id, const float gain,
                     float *effective)
{
    std::lock_guard lk (t_mutex);

    if (status == STATUS_STOPPED)
        return CMD_SESSION_STOPPED;

    const float g = clamp_volume (gain);
    volumes[user_id] = g;

    if (effective)
        *effective = g;

    if (current_track && current_track->requested_by == user_id)
        driver->set_gain (g);

    publish_snapshot ();

    return CMD_OK;
}

command_status_t
Session::join (const dpp::snowflake &voice_channel_id)
{
    std::lock_guard lk (t_mutex);

    if (status == STATUS_STOPPED)
        return CMD_SESSION_STOPPED;

    if (!voice_channel_id)
        return CMD_INVALID_STATE;

    const bool connected = driver->is_connected ();

    if (connected && this->voice_channel_id == voice_channel_id)
        return CMD_NOOP;

    const int res = connected && this->voice_channel_id
                        ? driver->move (voice_channel_id)
                        : driver->connect (voice_channel_id);

    if (res != 0)
        {
            fprintf (stderr,
                     "[Session::join ERROR] %ld: Driver failed joining %ld: "
                     "%d\n",
                     (uint64_t)guild_id, (uint64_t)voice_channel_id, res);

            return CMD_INVALID_STATE;
        }

    this->voice_channel_id = voice_channel_id;
    voice_confirmed = false;

    publish_snapshot ();

    return CMD_OK;
}

command_status_t
Session::set_voice_channel (const dpp::snowflake &voice_channel_id)
{
    std::lock_guard lk (t_mutex);

    if (status == STATUS_STOPPED)
        return CMD_SESSION_STOPPED;

    voice_confirmed = true;

    if (this->voice_channel_id == voice_channel_id)
        return CMD_NOOP;

    this->voice_channel_id = voice_channel_id;

    publish_snapshot ();

    return CMD_OK;
}

bool
Session::is_joining ()
{
    std::lock_guard lk (t_mutex);
    return status != STATUS_STOPPED && voice_channel_id && !voice_confirmed;
}

command_status_t
Session::jump (const size_t index)
{
    std::vector<event_t> events;

    {
        std::lock_guard lk (t_mutex);

        if (status == STATUS_STOPPED)
            return CMD_SESSION_STOPPED;

        if (!current_track)
            return CMD_INVALID_STATE;

        if (index >= queue.size ())
            return CMD_INVALID_INDEX;

        if (index)
            {
                track_t t = queue.at (index);
                queue.erase (queue.begin () + index);
                queue.push_front (t);
            }

        generation++;
        cancel_send ();

        advance (true, events);

        publish_snapshot ();
    }

    emit (events);

    return CMD_OK;
}

command_status_t
Session::remove (const size_t index, track_t *removed)
{
    std::lock_guard lk (t_mutex);

    if (status == STATUS_STOPPED)
        return CMD_SESSION_STOPPED;

    if (index >= queue.size ())
        return CMD_INVALID_INDEX;

    if (removed)
        *removed = queue.at (index);

    queue.erase (queue.begin () + index);

    publish_snapshot ();

    return CMD_OK;
}

command_status_t
Session::shuffle ()
{
    std::lock_guard lk (t_mutex);

    if (status == STATUS_STOPPED)
        return CMD_SESSION_STOPPED;

    const size_t siz = queue.size ();
    if (siz < 2)
        return CMD_NOOP;

    std::deque<track_t> n_queue;
    for (size_t i : shuffle_indexes (siz))
        {
            n_queue.push_back (queue.at (i));
        }

    queue = std::move (n_queue);

    publish_snapshot ();

    return CMD_OK;
}

bool
Session::try_expire (const long long now, bool *expired_now)
{
    std::lock_guard lk (t_mutex);

    if (status == STATUS_STOPPED)
        return true;

    if (status != STATUS_IDLE || current_track || !queue.empty ())
        return false;

    if (now - idle_since <= util::ms_to_ns (config.idle_timeout_ms))
        return false;

    if (get_debug_state ())
        fprintf (stderr, "[Session::try_expire] %ld: Idle expired\n",
                 (uint64_t)guild_id);

    // caller holds registry lock, it reports the stop once released
    std::vector<event_t> events;
    stop_locked (events);

    if (expired_now)
        *expired_now = true;

    publish_snapshot ();

    return true;
}

snapshot_ptr_t
Session::snapshot ()
{
    std::lock_guard lk (snapshot_m);
    return published;
}

} // woot::player
