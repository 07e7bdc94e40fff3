#include <catch2/catch.hpp>

#include "fakes.h"
#include "woot/player.h"
#include <algorithm>
#include <cmath>
#include <limits>

using namespace woot;
using namespace woot::player;
using woot::tests::EventLog;
using woot::tests::FakeDriver;
using woot::tests::FakeResolver;
using woot::tests::wait_until;

namespace
{

struct fixture_t
{
    std::shared_ptr<FakeResolver> resolver;
    std::shared_ptr<FakeDriver> driver;
    EventLog log;
    session_ptr_t session;

    explicit fixture_t (const session_config_t &config = {})
        : resolver (std::make_shared<FakeResolver> ()),
          driver (std::make_shared<FakeDriver> ())
    {
        session = std::make_shared<Session> (1234, config, resolver, driver,
                                             log.listener ());
    }

    ~fixture_t ()
    {
        driver->ignore_cancel = false;
        session->stop ();
        driver->wait_for_idle ();
    }

    void
    enqueue (const std::string &query, const dpp::snowflake &user = 42)
    {
        REQUIRE (session->enqueue (create_track (query, user)) == CMD_OK);
    }

    bool
    wait_status (const session_status_t status)
    {
        return wait_until (
            [this, status] () { return session->snapshot ()->status == status; });
    }

    bool
    wait_playing (const std::string &query)
    {
        return wait_until ([this, &query] () {
            auto snap = session->snapshot ();
            return snap->status == STATUS_PLAYING && snap->current_track
                   && snap->current_track->query == query;
        });
    }

    std::vector<std::string>
    queued_queries ()
    {
        std::vector<std::string> ret;
        for (const track_t &t : session->snapshot ()->queue)
            ret.push_back (t.query);

        return ret;
    }
};

} // namespace

TEST_CASE ("New session is idle", "[session]")
{
    fixture_t f;

    auto snap = f.session->snapshot ();
    CHECK (snap->status == STATUS_IDLE);
    CHECK (snap->loop_mode == l_none);
    CHECK_FALSE (snap->current_track);
    CHECK (snap->queue.empty ());
    CHECK (snap->elapsed_ms (util::get_current_ts ()) == 0);
}

TEST_CASE ("Enqueue on idle session resolves and plays", "[session]")
{
    fixture_t f;

    f.enqueue ("a");

    REQUIRE (f.driver->wait_for_sends (1));
    REQUIRE (f.wait_playing ("a"));

    auto snap = f.session->snapshot ();
    CHECK (snap->current_track->title == "Title of a");
    CHECK (snap->current_track->requested_by == 42);
    CHECK (snap->queue.empty ());
    CHECK (f.driver->get_sent ().at (0) == "fake://a");
    CHECK (f.log.count (EV_TRACK_STARTED) == 1);
}

TEST_CASE ("Queued tracks play in order and stay unresolved until their turn",
           "[session]")
{
    fixture_t f;

    f.enqueue ("a");
    f.enqueue ("b");
    f.enqueue ("c");

    REQUIRE (f.wait_playing ("a"));
    CHECK (f.queued_queries () == std::vector<std::string>{ "b", "c" });
    CHECK (f.resolver->call_count ("b") == 0);
    CHECK (f.resolver->call_count ("c") == 0);

    // unresolved entries show the query until resolved
    CHECK (f.session->snapshot ()->queue.at (0).title == "b");

    f.driver->finish ("fake://a", STREAM_OK);
    REQUIRE (f.wait_playing ("b"));
    CHECK (f.resolver->call_count ("b") == 1);

    f.driver->finish ("fake://b", STREAM_OK);
    REQUIRE (f.wait_playing ("c"));

    f.driver->finish ("fake://c", STREAM_OK);
    REQUIRE (f.wait_status (STATUS_IDLE));

    CHECK (f.driver->get_sent ()
           == std::vector<std::string>{ "fake://a", "fake://b", "fake://c" });

    auto empty = f.log.get (EV_QUEUE_EMPTY);
    REQUIRE (empty.size () == 1);
    CHECK (empty.at (0).message == "Queue finished");
}

TEST_CASE ("Track loop replays current track", "[session][loop]")
{
    SECTION ("reusing a fresh stream")
    {
        fixture_t f;
        REQUIRE (f.session->set_loop_mode (l_track) == CMD_OK);

        f.enqueue ("a");
        f.enqueue ("b");
        REQUIRE (f.driver->wait_for_sends (1));

        f.driver->finish ("fake://a", STREAM_OK);
        REQUIRE (f.driver->wait_for_sends (2));
        REQUIRE (f.wait_playing ("a"));

        CHECK (f.driver->get_sent ().at (1) == "fake://a");
        CHECK (f.resolver->call_count ("a") == 1);
        CHECK (f.queued_queries () == std::vector<std::string>{ "b" });
    }

    SECTION ("resolving again once the stream expired")
    {
        session_config_t config;
        config.stream_ttl_ms = 1;

        fixture_t f (config);
        REQUIRE (f.session->set_loop_mode (l_track) == CMD_OK);

        f.enqueue ("a");
        REQUIRE (f.driver->wait_for_sends (1));

        std::this_thread::sleep_for (std::chrono::milliseconds (10));
        f.driver->finish ("fake://a", STREAM_OK);

        REQUIRE (f.driver->wait_for_sends (2));
        CHECK (f.resolver->call_count ("a") == 2);
    }
}

TEST_CASE ("Queue loop appends finished track to the back", "[session][loop]")
{
    fixture_t f;
    REQUIRE (f.session->set_loop_mode (l_queue) == CMD_OK);

    f.enqueue ("a");
    f.enqueue ("b");
    REQUIRE (f.wait_playing ("a"));

    f.driver->finish ("fake://a", STREAM_OK);
    REQUIRE (f.wait_playing ("b"));
    CHECK (f.queued_queries () == std::vector<std::string>{ "a" });

    f.driver->finish ("fake://b", STREAM_OK);
    REQUIRE (f.wait_playing ("a"));
    CHECK (f.queued_queries () == std::vector<std::string>{ "b" });
}

TEST_CASE ("Set loop mode", "[session][loop]")
{
    fixture_t f;

    CHECK (f.session->set_loop_mode (l_none) == CMD_NOOP);
    CHECK (f.session->set_loop_mode (l_queue) == CMD_OK);
    CHECK (f.session->snapshot ()->loop_mode == l_queue);
    CHECK (f.session->set_loop_mode (l_queue) == CMD_NOOP);
}

TEST_CASE ("Skip", "[session][skip]")
{
    SECTION ("with nothing playing is refused")
    {
        fixture_t f;
        CHECK (f.session->skip () == CMD_INVALID_STATE);
    }

    SECTION ("moves to the next track")
    {
        fixture_t f;
        f.enqueue ("a");
        f.enqueue ("b");
        REQUIRE (f.wait_playing ("a"));

        CHECK (f.session->skip () == CMD_OK);
        REQUIRE (f.wait_playing ("b"));
        CHECK (f.session->snapshot ()->queue.empty ());
    }

    SECTION ("last track goes idle")
    {
        fixture_t f;
        f.enqueue ("a");
        REQUIRE (f.wait_playing ("a"));

        CHECK (f.session->skip () == CMD_OK);
        CHECK (f.session->snapshot ()->status == STATUS_IDLE);
        CHECK_FALSE (f.session->snapshot ()->current_track);
    }

    SECTION ("under track loop sends the track to the back")
    {
        fixture_t f;
        REQUIRE (f.session->set_loop_mode (l_track) == CMD_OK);
        f.enqueue ("a");
        f.enqueue ("b");
        REQUIRE (f.wait_playing ("a"));

        CHECK (f.session->skip () == CMD_OK);
        REQUIRE (f.wait_playing ("b"));
        CHECK (f.queued_queries () == std::vector<std::string>{ "a" });
    }

    SECTION ("a lone track under track loop is dropped")
    {
        fixture_t f;
        REQUIRE (f.session->set_loop_mode (l_track) == CMD_OK);
        f.enqueue ("a");
        REQUIRE (f.wait_playing ("a"));

        CHECK (f.session->skip () == CMD_OK);
        auto snap = f.session->snapshot ();
        CHECK (snap->status == STATUS_IDLE);
        CHECK (snap->queue.empty ());
    }

    SECTION ("a lone track under queue loop is dropped")
    {
        fixture_t f;
        REQUIRE (f.session->set_loop_mode (l_queue) == CMD_OK);
        f.enqueue ("a");
        REQUIRE (f.wait_playing ("a"));

        CHECK (f.session->skip () == CMD_OK);
        CHECK (f.session->snapshot ()->status == STATUS_IDLE);
    }
}

TEST_CASE ("Stale completion after skip is discarded", "[session][skip]")
{
    fixture_t f;
    f.driver->ignore_cancel = true;

    f.enqueue ("a");
    f.enqueue ("b");
    f.enqueue ("c");
    REQUIRE (f.wait_playing ("a"));

    REQUIRE (f.session->skip () == CMD_OK);
    REQUIRE (f.wait_playing ("b"));
    REQUIRE (f.driver->wait_for_sends (2));

    // the old send only now reports natural completion
    f.driver->finish ("fake://a", STREAM_OK);
    std::this_thread::sleep_for (std::chrono::milliseconds (50));

    auto snap = f.session->snapshot ();
    CHECK (snap->status == STATUS_PLAYING);
    CHECK (snap->current_track->query == "b");
    CHECK (f.queued_queries () == std::vector<std::string>{ "c" });
    CHECK (f.driver->send_count () == 2);
}

TEST_CASE ("Stale resolution after skip is discarded", "[session][skip]")
{
    fixture_t f;
    f.resolver->block ("a");

    f.enqueue ("a");
    f.enqueue ("b");
    REQUIRE (wait_until ([&f] () { return f.resolver->call_count ("a") == 1; }));
    CHECK (f.session->snapshot ()->status == STATUS_BUFFERING);

    REQUIRE (f.session->skip () == CMD_OK);
    REQUIRE (f.wait_playing ("b"));

    f.resolver->release ("a");
    std::this_thread::sleep_for (std::chrono::milliseconds (50));

    CHECK (f.session->snapshot ()->current_track->query == "b");
    CHECK (f.driver->get_sent () == std::vector<std::string>{ "fake://b" });
}

TEST_CASE ("Pause and resume", "[session]")
{
    fixture_t f;

    CHECK (f.session->pause () == CMD_INVALID_STATE);
    CHECK (f.session->resume () == CMD_INVALID_STATE);

    f.enqueue ("a");
    REQUIRE (f.wait_playing ("a"));

    CHECK (f.session->resume () == CMD_NOOP);

    CHECK (f.session->pause () == CMD_OK);
    CHECK (f.session->snapshot ()->status == STATUS_PAUSED);
    CHECK (f.driver->is_paused ());
    CHECK (f.session->pause () == CMD_NOOP);

    // elapsed is frozen while paused
    const long long later = util::get_current_ts () + util::ms_to_ns (60000);
    auto snap = f.session->snapshot ();
    CHECK (snap->elapsed_ms (later) < 60000);

    CHECK (f.session->resume () == CMD_OK);
    CHECK (f.session->snapshot ()->status == STATUS_PLAYING);
    CHECK_FALSE (f.driver->is_paused ());
}

TEST_CASE ("Natural completion while paused advances", "[session]")
{
    fixture_t f;
    f.enqueue ("a");
    f.enqueue ("b");
    REQUIRE (f.wait_playing ("a"));
    REQUIRE (f.session->pause () == CMD_OK);

    f.driver->finish ("fake://a", STREAM_OK);
    REQUIRE (f.wait_playing ("b"));
    CHECK_FALSE (f.driver->is_paused ());
}

TEST_CASE ("Stop is terminal", "[session]")
{
    fixture_t f;
    f.enqueue ("a");
    f.enqueue ("b");
    REQUIRE (f.wait_playing ("a"));

    CHECK (f.session->stop () == CMD_OK);

    auto snap = f.session->snapshot ();
    CHECK (snap->status == STATUS_STOPPED);
    CHECK_FALSE (snap->current_track);
    CHECK (snap->queue.empty ());
    CHECK (f.driver->disconnect_count.load () == 1);
    CHECK (f.log.count (EV_SESSION_STOPPED) == 1);

    CHECK (f.session->stop () == CMD_NOOP);
    CHECK (f.session->enqueue (create_track ("c", 42)) == CMD_SESSION_STOPPED);
    CHECK (f.session->pause () == CMD_SESSION_STOPPED);
    CHECK (f.session->resume () == CMD_SESSION_STOPPED);
    CHECK (f.session->skip () == CMD_SESSION_STOPPED);
    CHECK (f.session->shuffle () == CMD_SESSION_STOPPED);
    CHECK (f.session->set_loop_mode (l_queue) == CMD_SESSION_STOPPED);
    CHECK (f.session->set_volume (42, 1.0f) == CMD_SESSION_STOPPED);
    CHECK (f.session->join (100) == CMD_SESSION_STOPPED);

    REQUIRE (f.driver->wait_for_idle ());
    CHECK (f.log.count (EV_SESSION_STOPPED) == 1);
}

TEST_CASE ("Failed tracks are reported and skipped", "[session][failure]")
{
    SECTION ("on resolution failure")
    {
        fixture_t f;
        f.resolver->fail ("a", RESOLUTION_NOT_FOUND);

        f.enqueue ("a");
        f.enqueue ("b");

        REQUIRE (f.wait_playing ("b"));

        auto failed = f.log.get (EV_TRACK_FAILED);
        REQUIRE (failed.size () == 1);
        CHECK (failed.at (0).track->query == "a");
        CHECK_FALSE (failed.at (0).message.empty ());
    }

    SECTION ("on stream failure")
    {
        fixture_t f;
        f.enqueue ("a");
        f.enqueue ("b");
        REQUIRE (f.wait_playing ("a"));

        f.driver->finish ("fake://a", STREAM_DECODE_FAILURE);
        REQUIRE (f.wait_playing ("b"));

        auto failed = f.log.get (EV_TRACK_FAILED);
        REQUIRE (failed.size () == 1);
        CHECK (failed.at (0).track->title == "Title of a");
    }

    SECTION ("failed track is not replayed under track loop")
    {
        fixture_t f;
        REQUIRE (f.session->set_loop_mode (l_track) == CMD_OK);
        f.enqueue ("a");
        REQUIRE (f.wait_playing ("a"));

        f.driver->finish ("fake://a", STREAM_CONNECTION_LOST);
        REQUIRE (f.wait_status (STATUS_IDLE));
        CHECK (f.driver->send_count () == 1);
    }
}

TEST_CASE ("Too many consecutive failures clear the queue", "[session][failure]")
{
    session_config_t config;
    config.max_consecutive_failures = 2;

    fixture_t f (config);
    f.resolver->fail ("a", RESOLUTION_EXTERNAL_TOOL_FAILURE);
    f.resolver->fail ("b", RESOLUTION_TIMEOUT);

    // hold the first resolution so every track is queued before it fails
    f.resolver->block ("a");
    f.enqueue ("a");
    f.enqueue ("b");
    f.enqueue ("c");
    f.resolver->release ("a");

    REQUIRE (f.wait_status (STATUS_IDLE));

    auto snap = f.session->snapshot ();
    CHECK (snap->queue.empty ());
    CHECK (f.resolver->call_count ("c") == 0);
    CHECK (f.log.count (EV_TRACK_FAILED) == 2);

    auto empty = f.log.get (EV_QUEUE_EMPTY);
    REQUIRE (empty.size () == 1);
    CHECK (empty.at (0).message
           == "Too many consecutive failures, clearing the queue");
}

TEST_CASE ("Successful track resets failure count", "[session][failure]")
{
    session_config_t config;
    config.max_consecutive_failures = 2;

    fixture_t f (config);
    f.resolver->fail ("x", RESOLUTION_NOT_FOUND);
    f.resolver->fail ("y", RESOLUTION_NOT_FOUND);

    f.resolver->block ("x");
    f.enqueue ("x");
    f.enqueue ("a");
    f.enqueue ("y");
    f.enqueue ("b");
    f.resolver->release ("x");

    REQUIRE (f.wait_playing ("a"));
    f.driver->finish ("fake://a", STREAM_OK);

    REQUIRE (f.wait_playing ("b"));
    CHECK (f.log.count (EV_TRACK_FAILED) == 2);
}

TEST_CASE ("Jump", "[session][queue]")
{
    fixture_t f;

    CHECK (f.session->jump (0) == CMD_INVALID_STATE);

    f.enqueue ("a");
    f.enqueue ("b");
    f.enqueue ("c");
    f.enqueue ("d");
    REQUIRE (f.wait_playing ("a"));

    CHECK (f.session->jump (3) == CMD_INVALID_INDEX);

    CHECK (f.session->jump (2) == CMD_OK);
    REQUIRE (f.wait_playing ("d"));
    CHECK (f.queued_queries () == std::vector<std::string>{ "b", "c" });
}

TEST_CASE ("Remove", "[session][queue]")
{
    fixture_t f;

    CHECK (f.session->remove (0) == CMD_INVALID_INDEX);

    f.enqueue ("a");
    f.enqueue ("b");
    f.enqueue ("c");
    REQUIRE (f.wait_playing ("a"));

    track_t removed = {};
    CHECK (f.session->remove (5, &removed) == CMD_INVALID_INDEX);
    CHECK (f.session->remove (0, &removed) == CMD_OK);
    CHECK (removed.query == "b");
    CHECK (f.queued_queries () == std::vector<std::string>{ "c" });

    // current track is untouched
    CHECK (f.session->snapshot ()->current_track->query == "a");
}

TEST_CASE ("Shuffle keeps the same tracks", "[session][queue]")
{
    fixture_t f;

    CHECK (f.session->shuffle () == CMD_NOOP);

    f.enqueue ("a");
    f.enqueue ("b");
    REQUIRE (f.wait_playing ("a"));
    CHECK (f.session->shuffle () == CMD_NOOP);

    for (const char *q : { "c", "d", "e", "f" })
        f.enqueue (q);

    auto before = f.queued_queries ();
    CHECK (f.session->shuffle () == CMD_OK);
    auto after = f.queued_queries ();

    std::sort (before.begin (), before.end ());
    std::sort (after.begin (), after.end ());
    CHECK (before == after);
    CHECK (f.session->snapshot ()->current_track->query == "a");
}

TEST_CASE ("Volume is clamped per user", "[session][volume]")
{
    fixture_t f;
    float effective = -1.0f;

    CHECK (f.session->set_volume (42, 5.0f, &effective) == CMD_OK);
    CHECK (effective == Approx (2.0f));

    CHECK (f.session->set_volume (42, -1.0f, &effective) == CMD_OK);
    CHECK (effective == Approx (0.0f));

    CHECK (f.session->set_volume (
               42, std::numeric_limits<float>::quiet_NaN (), &effective)
           == CMD_OK);
    CHECK (effective == Approx (1.0f));

    CHECK (f.session->set_volume (7, 0.5f) == CMD_OK);

    auto snap = f.session->snapshot ();
    CHECK (snap->volumes.at (42) == Approx (1.0f));
    CHECK (snap->volumes.at (7) == Approx (0.5f));
}

TEST_CASE ("Volume applies to tracks of its user", "[session][volume]")
{
    fixture_t f;

    REQUIRE (f.session->set_volume (7, 0.25f) == CMD_OK);

    f.enqueue ("a", 7);
    f.enqueue ("b", 8);
    REQUIRE (f.wait_playing ("a"));
    CHECK (f.driver->get_gain () == Approx (0.25f));

    // someone else's volume doesn't touch the current track
    REQUIRE (f.session->set_volume (8, 1.5f) == CMD_OK);
    CHECK (f.driver->get_gain () == Approx (0.25f));

    REQUIRE (f.session->set_volume (7, 0.75f) == CMD_OK);
    CHECK (f.driver->get_gain () == Approx (0.75f));

    f.driver->finish ("fake://a", STREAM_OK);
    REQUIRE (f.wait_playing ("b"));
    CHECK (f.driver->get_gain () == Approx (1.5f));
}

TEST_CASE ("Join", "[session]")
{
    fixture_t f;

    CHECK (f.session->join (0) == CMD_INVALID_STATE);

    CHECK (f.session->join (100) == CMD_OK);
    CHECK (f.session->snapshot ()->voice_channel_id == 100);
    CHECK (f.driver->connect_count.load () == 1);

    CHECK (f.session->join (100) == CMD_NOOP);

    CHECK (f.session->join (200) == CMD_OK);
    CHECK (f.driver->move_count.load () == 1);
    CHECK (f.driver->get_channel_id () == 200);
    CHECK (f.session->snapshot ()->voice_channel_id == 200);

    CHECK (f.session->set_voice_channel (300) == CMD_OK);
    CHECK (f.session->set_voice_channel (300) == CMD_NOOP);
}

TEST_CASE ("Join stays pending until the gateway reports it",
           "[session]")
{
    fixture_t f;

    CHECK_FALSE (f.session->is_joining ());

    REQUIRE (f.session->join (100) == CMD_OK);
    CHECK (f.session->is_joining ());

    // our own join arriving reports the same channel
    CHECK (f.session->set_voice_channel (100) == CMD_NOOP);
    CHECK_FALSE (f.session->is_joining ());

    REQUIRE (f.session->join (200) == CMD_OK);
    CHECK (f.session->is_joining ());

    REQUIRE (f.session->stop () == CMD_OK);
    CHECK_FALSE (f.session->is_joining ());
}

TEST_CASE ("Shutdown stops without reporting", "[session]")
{
    fixture_t f;
    f.enqueue ("a");
    REQUIRE (f.wait_playing ("a"));

    CHECK (f.session->shutdown ());

    CHECK (f.session->snapshot ()->status == STATUS_STOPPED);
    CHECK (f.driver->disconnect_count.load () == 1);
    REQUIRE (f.driver->wait_for_idle ());
    CHECK (f.log.count (EV_SESSION_STOPPED) == 0);

    CHECK_FALSE (f.session->shutdown ());
    CHECK (f.session->stop () == CMD_NOOP);
    CHECK (f.driver->disconnect_count.load () == 1);
}

TEST_CASE ("Join failure is reported", "[session]")
{
    fixture_t f;
    f.driver->connect_result = -1;

    CHECK (f.session->join (100) == CMD_INVALID_STATE);
    CHECK (f.session->snapshot ()->voice_channel_id == 0);
}

TEST_CASE ("Idle session expires", "[session]")
{
    session_config_t config;
    config.idle_timeout_ms = 10;

    fixture_t f (config);
    const long long now = util::get_current_ts ();

    CHECK_FALSE (f.session->try_expire (now));

    bool expired_now = false;
    CHECK (f.session->try_expire (now + util::ms_to_ns (1000), &expired_now));
    CHECK (expired_now);
    CHECK (f.session->snapshot ()->status == STATUS_STOPPED);
    CHECK (f.driver->disconnect_count.load () == 1);

    // reporting is left to the caller
    CHECK (f.log.count (EV_SESSION_STOPPED) == 0);

    expired_now = false;
    CHECK (f.session->try_expire (now + util::ms_to_ns (2000), &expired_now));
    CHECK_FALSE (expired_now);
}

TEST_CASE ("Playing session never expires", "[session]")
{
    session_config_t config;
    config.idle_timeout_ms = 1;

    fixture_t f (config);
    f.enqueue ("a");
    REQUIRE (f.wait_playing ("a"));

    CHECK_FALSE (f.session->try_expire (util::get_current_ts ()
                                        + util::ms_to_ns (60000)));
    CHECK (f.session->snapshot ()->status == STATUS_PLAYING);
}

TEST_CASE ("Published snapshot is immutable", "[session]")
{
    fixture_t f;
    f.enqueue ("a");
    REQUIRE (f.wait_playing ("a"));

    auto before = f.session->snapshot ();
    f.enqueue ("b");
    auto after = f.session->snapshot ();

    CHECK (before->queue.empty ());
    CHECK (after->queue.size () == 1);
    CHECK (before != after);
}

TEST_CASE ("Concurrent enqueue keeps every track", "[session]")
{
    fixture_t f;

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++)
        threads.emplace_back ([&f, i] () {
            for (int j = 0; j < 10; j++)
                f.session->enqueue (create_track (
                    std::to_string (i) + "-" + std::to_string (j), 42));
        });

    for (auto &t : threads)
        t.join ();

    REQUIRE (wait_until ([&f] () {
        return f.session->snapshot ()->status == STATUS_PLAYING;
    }));

    auto snap = f.session->snapshot ();
    CHECK (snap->queue.size () == 79);
}
