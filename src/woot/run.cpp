/*
    Global program states goes here
*/

#include "woot/events.h"
#include "woot/panel.h"
#include "woot/resolver.h"
#include "woot/thread_manager.h"
#include "woot/util.h"
#include "woot/voice_driver.h"
#include "woot/woot.h"
#include <csignal>
#include <iostream>
#include <mutex>
#include <thread>
#include <unistd.h>

#define STR_SIZE(x) (sizeof (x) / sizeof (x[0])) - 1

static const char CONFIG_FILE[] = "woot_conf.json";

namespace woot
{
// use this mutex for every state stored here
std::mutex main_mutex;

dpp::snowflake bot_id = 0;
dpp::cluster *client_ptr = nullptr;
player::registry_ptr_t registry_ptr = nullptr;
spotify::expander_ptr_t spotify_ptr = nullptr;

// ================================================================================

dpp::cluster *
get_client_ptr ()
{
    if (!get_running_state ())
        return nullptr;

    std::lock_guard lk (main_mutex);
    return client_ptr;
}

dpp::snowflake
get_bot_id ()
{
    std::lock_guard lk (main_mutex);

    if (bot_id)
        return bot_id;

    bot_id = get_config_value<uint64_t> ("WOOT_ID", 0);

    return bot_id;
}

std::string
get_bot_token ()
{
    return get_config_value<std::string> ("WOOT_TKN", "");
}

player::registry_ptr_t
get_registry_ptr ()
{
    if (!get_running_state ())
        return nullptr;

    std::lock_guard lk (main_mutex);
    return registry_ptr;
}

spotify::expander_ptr_t
get_spotify_ptr ()
{
    if (!get_running_state ())
        return nullptr;

    std::lock_guard lk (main_mutex);
    return spotify_ptr;
}

// ================================================================================

std::atomic<int> _sigint_count{ 0 };

void
on_sigint ([[maybe_unused]] int code)
{
    _sigint_count++;

    static const char exit_msg[] = "Received SIGINT, exiting...\n";

    // printf isn't signal safe, use write
    ssize_t w = write (STDERR_FILENO, exit_msg, STR_SIZE (exit_msg));

    if (_sigint_count >= 5)
        {
            static const char force_exit_msg[]
                = "Understood, force exiting...\n";

            w = write (STDERR_FILENO, force_exit_msg,
                       STR_SIZE (force_exit_msg));

            _exit (255);
        }

    (void)w;

    set_running_state (false);
}

auto dpp_cout_logger = dpp::utility::cout_logger ();

int
run (int argc, const char *argv[])
{
    signal (SIGINT, on_sigint);
    set_running_state (true);

    // load config file
    int config_status = load_config (CONFIG_FILE);
    if (config_status != 0)
        return config_status;

    set_debug_state (get_config_value<bool> ("DEBUG", false));

    const std::string token = get_bot_token ();
    if (token.empty ())
        {
            fprintf (stderr, "[ERROR] No token provided\n");
            return -1;
        }

    const dpp::snowflake id = get_bot_id ();
    if (!id)
        {
            fprintf (stderr, "[ERROR] No bot user Id provided\n");
            return -1;
        }

    dpp::cluster client (token, dpp::i_default_intents);

    {
        std::lock_guard lk (main_mutex);
        client_ptr = &client;
    }

    if (argc > 1)
        {
            int ret = cli (client, id, argc, argv);

            while (get_running_state ())
                std::this_thread::sleep_for (std::chrono::seconds (1));

            return ret;
        }

    const player::session_config_t session_config = get_session_config ();

    player::resolver_ptr_t resolver = std::make_shared<player::YTDLPResolver> (
        player::get_ytdlp_options ());

    auto registry = std::make_shared<player::Registry> (
        session_config, resolver, player::create_dpp_driver_factory (&client));

    registry->set_event_listener (panel::handle_event);

    spotify::expander_ptr_t expander = spotify::create_expander ();
    if (!expander->is_configured ())
        fprintf (stderr, "[run] Spotify credentials not set, Spotify links "
                         "are disabled\n");

    {
        std::lock_guard lk (main_mutex);
        registry_ptr = registry;
        spotify_ptr = expander;
    }

    client.on_log ([] (const dpp::log_t &event) {
        if (!get_debug_state () && event.severity < dpp::ll_error)
            return;

        dpp_cout_logger (event);
    });

    events::load_events (&client);

    client.start (dpp::st_return);

    const long long panel_refresh_interval = util::ms_to_ns (
        get_config_value<long long> ("PANEL_REFRESH_INTERVAL_MS", 5000));

    long long last_sweep = util::get_current_ts ();
    long long last_panel_refresh = last_sweep;

    while (get_running_state ())
        {
            std::this_thread::sleep_for (std::chrono::milliseconds (750));

            const long long now = util::get_current_ts ();

            if ((now - last_sweep) > util::ms_to_ns (5000))
                {
                    size_t removed = registry->sweep_idle (now);

                    if (removed && get_debug_state ())
                        fprintf (stderr, "[run] Swept %ld sessions\n",
                                 removed);

                    last_sweep = now;
                }

            if (panel_refresh_interval > 0
                && (now - last_panel_refresh) > panel_refresh_interval)
                {
                    panel::refresh_all ();
                    last_panel_refresh = now;
                }

            thread_manager::join_done ();
        }

    // disconnect every voice connection while the client is still alive
    registry->shutdown_all ();

    client.shutdown ();

    {
        std::lock_guard lk (main_mutex);
        client_ptr = nullptr;
    }

    thread_manager::join_all ();

    {
        std::lock_guard lk (main_mutex);
        registry_ptr = nullptr;
        spotify_ptr = nullptr;
    }

    return 0;
}

} // woot

// vim: et sw=4 ts=8
