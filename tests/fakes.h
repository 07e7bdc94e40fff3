#ifndef WOOT_TESTS_FAKES_H
#define WOOT_TESTS_FAKES_H

#include "woot/player.h"
#include "woot/resolver.h"
#include "woot/transmission.h"
#include "woot/util.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace woot::tests
{

/**
 * @brief Poll pred until it holds or timeout_ms passed
 */
inline bool
wait_until (const std::function<bool ()> &pred, const int timeout_ms = 3000)
{
    const auto deadline = std::chrono::steady_clock::now ()
                          + std::chrono::milliseconds (timeout_ms);

    while (std::chrono::steady_clock::now () < deadline)
        {
            if (pred ())
                return true;

            std::this_thread::sleep_for (std::chrono::milliseconds (2));
        }

    return pred ();
}

/**
 * @brief Driver whose send blocks until the test finishes it by url or the
 * token is cancelled
 */
class FakeDriver : public player::TransmissionDriver
{
    std::mutex m;
    std::condition_variable cv;

    std::map<std::string, player::stream_error_t> results;
    std::vector<std::string> sent;
    int active;

    bool connected;
    dpp::snowflake channel_id;
    float gain;
    bool paused;

  public:
    std::atomic<bool> ignore_cancel{ false };
    std::atomic<int> connect_count{ 0 };
    std::atomic<int> move_count{ 0 };
    std::atomic<int> disconnect_count{ 0 };
    // disconnect holds until release_disconnect
    std::atomic<bool> block_disconnect{ false };
    std::atomic<bool> disconnect_done{ false };
    int connect_result;

    FakeDriver ()
        : active (0), connected (false), channel_id (0), gain (1.0f),
          paused (false), connect_result (0)
    {
    }

    int
    connect (const dpp::snowflake &voice_channel_id) override
    {
        std::lock_guard lk (m);
        connect_count++;

        if (connect_result != 0)
            return connect_result;

        connected = true;
        channel_id = voice_channel_id;
        return 0;
    }

    int
    move (const dpp::snowflake &voice_channel_id) override
    {
        std::lock_guard lk (m);
        move_count++;
        channel_id = voice_channel_id;
        return 0;
    }

    void
    disconnect () override
    {
        std::unique_lock lk (m);
        disconnect_count++;
        cv.notify_all ();

        cv.wait (lk, [this] () { return !block_disconnect; });

        connected = false;
        channel_id = 0;
        disconnect_done = true;
    }

    void
    release_disconnect ()
    {
        std::lock_guard lk (m);
        block_disconnect = false;
        cv.notify_all ();
    }

    player::stream_error_t
    send (const player::stream_source_t &source,
          const player::cancel_token_ptr_t &token) override
    {
        std::unique_lock lk (m);

        sent.push_back (source.url);
        active++;
        cv.notify_all ();

        player::stream_error_t ret = player::STREAM_CANCELLED;

        while (true)
            {
                auto i = results.find (source.url);
                if (i != results.end ())
                    {
                        ret = i->second;
                        results.erase (i);
                        break;
                    }

                if (!ignore_cancel && token->is_cancelled ())
                    break;

                cv.wait_for (lk, std::chrono::milliseconds (2));
            }

        active--;
        cv.notify_all ();

        return ret;
    }

    void
    set_gain (const float gain) override
    {
        std::lock_guard lk (m);
        this->gain = gain;
    }

    void
    set_paused (const bool paused) override
    {
        std::lock_guard lk (m);
        this->paused = paused;
    }

    bool
    is_connected () override
    {
        std::lock_guard lk (m);
        return connected;
    }

    /**
     * @brief Complete the send streaming url with result
     */
    void
    finish (const std::string &url, const player::stream_error_t result)
    {
        std::lock_guard lk (m);
        results[url] = result;
        cv.notify_all ();
    }

    bool
    wait_for_sends (const size_t count, const int timeout_ms = 3000)
    {
        std::unique_lock lk (m);
        return cv.wait_for (lk, std::chrono::milliseconds (timeout_ms),
                            [this, count] () { return sent.size () >= count; });
    }

    bool
    wait_for_idle (const int timeout_ms = 3000)
    {
        std::unique_lock lk (m);
        return cv.wait_for (lk, std::chrono::milliseconds (timeout_ms),
                            [this] () { return active == 0; });
    }

    std::vector<std::string>
    get_sent ()
    {
        std::lock_guard lk (m);
        return sent;
    }

    size_t
    send_count ()
    {
        std::lock_guard lk (m);
        return sent.size ();
    }

    float
    get_gain ()
    {
        std::lock_guard lk (m);
        return gain;
    }

    bool
    is_paused ()
    {
        std::lock_guard lk (m);
        return paused;
    }

    dpp::snowflake
    get_channel_id ()
    {
        std::lock_guard lk (m);
        return channel_id;
    }
};

/**
 * @brief Resolver producing "Title of <query>" streaming from
 * "fake://<query>"
 */
class FakeResolver : public player::TrackResolver
{
    std::mutex m;
    std::condition_variable cv;

    std::map<std::string, player::resolution_error_kind_t> failures;
    std::map<std::string, int> calls;
    std::set<std::string> blocked;

  public:
    player::track_t
    resolve (const std::string &query) override
    {
        std::unique_lock lk (m);

        calls[query]++;
        cv.notify_all ();

        cv.wait (lk, [this, &query] () {
            return blocked.find (query) == blocked.end ();
        });

        auto f = failures.find (query);
        if (f != failures.end ())
            throw player::resolution_error (f->second,
                                            "Can't resolve " + query);

        player::track_t t = {};
        t.title = "Title of " + query;
        t.duration = 180000;

        auto source = std::make_shared<player::stream_source_t> ();
        source->url = "fake://" + query;
        source->resolved_at = util::get_current_ts ();

        t.stream = source;

        return t;
    }

    void
    fail (const std::string &query, const player::resolution_error_kind_t kind)
    {
        std::lock_guard lk (m);
        failures[query] = kind;
    }

    void
    block (const std::string &query)
    {
        std::lock_guard lk (m);
        blocked.insert (query);
    }

    void
    release (const std::string &query)
    {
        std::lock_guard lk (m);
        blocked.erase (query);
        cv.notify_all ();
    }

    int
    call_count (const std::string &query)
    {
        std::lock_guard lk (m);
        auto i = calls.find (query);
        return i == calls.end () ? 0 : i->second;
    }
};

/**
 * @brief Thread safe event recorder usable as session listener
 */
class EventLog
{
    std::mutex m;
    std::vector<player::event_t> events;

  public:
    player::event_listener_t
    listener ()
    {
        return [this] (const player::event_t &e) {
            std::lock_guard lk (m);
            events.push_back (e);
        };
    }

    size_t
    count (const player::event_type_t type)
    {
        std::lock_guard lk (m);

        size_t c = 0;
        for (const auto &e : events)
            if (e.type == type)
                c++;

        return c;
    }

    std::vector<player::event_t>
    get (const player::event_type_t type)
    {
        std::lock_guard lk (m);

        std::vector<player::event_t> ret;
        for (const auto &e : events)
            if (e.type == type)
                ret.push_back (e);

        return ret;
    }
};

} // woot::tests

#endif // WOOT_TESTS_FAKES_H
