#include "woot/player.h"
#include "woot/util.h"
#include "woot/woot.h"
#include <stdio.h>

namespace woot::player
{

Registry::Registry (const session_config_t &config, resolver_ptr_t resolver,
                    driver_factory_t driver_factory)
    : config (config), resolver (resolver), driver_factory (driver_factory)
{
}

Registry::~Registry () { shutdown_all (); }

void
Registry::dispatch_event (const event_t &event)
{
    event_listener_t l;

    {
        std::lock_guard lk (listener_m);
        l = listener;
    }

    if (l)
        l (event);
}

session_ptr_t
Registry::get_or_create (const dpp::snowflake &guild_id)
{
    std::lock_guard lk (ps_m);

    auto i = sessions.find (guild_id);
    if (i != sessions.end ())
        {
            auto snap = i->second->snapshot ();
            if (snap->status != STATUS_STOPPED)
                return i->second;

            sessions.erase (i);
        }

    driver_ptr_t driver = driver_factory (guild_id);

    // every session is stopped by shutdown_all before registry is gone,
    // stale completions after that never reach the listener
    auto s = std::make_shared<Session> (
        guild_id, config, resolver, driver,
        [this] (const event_t &event) { this->dispatch_event (event); });

    sessions.insert_or_assign (guild_id, s);

    if (get_debug_state ())
        fprintf (stderr, "[Registry::get_or_create] New session: %ld\n",
                 (uint64_t)guild_id);

    return s;
}

session_ptr_t
Registry::get (const dpp::snowflake &guild_id)
{
    std::lock_guard lk (ps_m);

    auto i = sessions.find (guild_id);
    if (i == sessions.end ())
        return NULL;

    return i->second;
}

bool
Registry::remove (const dpp::snowflake &guild_id)
{
    bool stopped_now;

    {
        std::lock_guard lk (ps_m);

        auto i = sessions.find (guild_id);
        if (i == sessions.end ())
            return false;

        // stopped before erasing, get_or_create waiting on ps_m must not
        // connect a new session while this one is still disconnecting
        stopped_now = i->second->shutdown ();
        sessions.erase (i);
    }

    if (stopped_now)
        dispatch_event ({ EV_SESSION_STOPPED, guild_id, std::nullopt, "" });

    return true;
}

size_t
Registry::sweep_idle (const long long now)
{
    std::vector<dpp::snowflake> expired;
    size_t removed = 0;

    {
        std::lock_guard lk (ps_m);

        auto i = sessions.begin ();
        while (i != sessions.end ())
            {
                // expiry check and stop happen atomically under the session
                // lock, a racing enqueue either keeps it alive or gets
                // CMD_SESSION_STOPPED
                bool expired_now = false;
                if (!i->second->try_expire (now, &expired_now))
                    {
                        i++;
                        continue;
                    }

                if (expired_now)
                    expired.push_back (i->first);

                i = sessions.erase (i);
                removed++;
            }
    }

    for (const dpp::snowflake &guild_id : expired)
        {
            dispatch_event ({ EV_SESSION_STOPPED, guild_id, std::nullopt,
                              "Left voice channel after being idle" });
        }

    if (removed && get_debug_state ())
        fprintf (stderr, "[Registry::sweep_idle] Removed %ld sessions\n",
                 removed);

    return removed;
}

void
Registry::handle_voice_disconnected (const dpp::snowflake &guild_id)
{
    bool stopped_now;

    {
        std::lock_guard lk (ps_m);

        auto i = sessions.find (guild_id);
        if (i == sessions.end ())
            return;

        if (i->second->is_joining ())
            {
                if (get_debug_state ())
                    fprintf (stderr,
                             "[Registry::handle_voice_disconnected] %ld: "
                             "Ignoring disconnect of previous connection\n",
                             (uint64_t)guild_id);
                return;
            }

        stopped_now = i->second->shutdown ();
        sessions.erase (i);
    }

    if (!stopped_now)
        return;

    fprintf (stderr,
             "[Registry::handle_voice_disconnected] %ld: Removed from voice "
             "channel, stopped session\n",
             (uint64_t)guild_id);

    dispatch_event ({ EV_SESSION_STOPPED, guild_id, std::nullopt, "" });
}

void
Registry::handle_voice_moved (const dpp::snowflake &guild_id,
                              const dpp::snowflake &voice_channel_id)
{
    session_ptr_t s = get (guild_id);
    if (!s)
        return;

    s->set_voice_channel (voice_channel_id);
}

std::vector<dpp::snowflake>
Registry::get_guild_ids ()
{
    std::lock_guard lk (ps_m);

    std::vector<dpp::snowflake> ret;
    ret.reserve (sessions.size ());

    for (const auto &p : sessions)
        ret.push_back (p.first);

    return ret;
}

void
Registry::shutdown_all ()
{
    std::vector<dpp::snowflake> stopped;

    {
        std::lock_guard lk (ps_m);

        for (auto &p : sessions)
            if (p.second->shutdown ())
                stopped.push_back (p.first);

        sessions.clear ();
    }

    for (const dpp::snowflake &guild_id : stopped)
        dispatch_event ({ EV_SESSION_STOPPED, guild_id, std::nullopt, "" });
}

void
Registry::set_event_listener (event_listener_t listener)
{
    std::lock_guard lk (listener_m);
    this->listener = listener;
}

const session_config_t &
Registry::get_config () const
{
    return config;
}

} // woot::player
