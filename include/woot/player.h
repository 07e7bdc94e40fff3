#ifndef WOOT_PLAYER_H
#define WOOT_PLAYER_H

#include "woot/resolver.h"
#include "woot/track.h"
#include "woot/transmission.h"
#include <deque>
#include <dpp/snowflake.h>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace woot::player
{

enum loop_mode_t
{
    // No looping
    l_none,
    // Replay current track on natural completion
    l_track,
    // Append finished track to the back of the queue
    l_queue,
};

enum session_status_t
{
    STATUS_IDLE,
    STATUS_BUFFERING,
    STATUS_PLAYING,
    STATUS_PAUSED,
    // terminal, obtain a fresh session from Registry
    STATUS_STOPPED,
};

enum command_status_t
{
    CMD_OK = 0,
    // already in requested state
    CMD_NOOP,
    CMD_INVALID_STATE,
    CMD_SESSION_STOPPED,
    CMD_INVALID_INDEX,
};

enum event_type_t
{
    EV_TRACK_STARTED,
    EV_TRACK_FAILED,
    EV_QUEUE_EMPTY,
    EV_SESSION_STOPPED,
};

const char *loop_mode_str (const loop_mode_t mode);

const char *session_status_str (const session_status_t status);

const char *command_status_str (const command_status_t status);

struct event_t
{
    event_type_t type;
    dpp::snowflake guild_id;
    std::optional<track_t> track;
    std::string message;
};

using event_listener_t = std::function<void (const event_t &)>;

struct session_config_t
{
    long long idle_timeout_ms = 300000;
    int max_consecutive_failures = 3;
    float volume_min = 0.0f;
    float volume_max = 2.0f;
    float default_volume = 1.0f;
    // reuse resolved stream for track loop while younger than this
    long long stream_ttl_ms = 10800000;
};

struct snapshot_t
{
    dpp::snowflake guild_id;
    session_status_t status;
    loop_mode_t loop_mode;
    std::optional<track_t> current_track;
    std::vector<track_t> queue;
    std::map<dpp::snowflake, float> volumes;
    dpp::snowflake voice_channel_id;

    // util::get_current_ts () timestamps, 0 when unset
    long long started_at;
    long long paused_at;
    long long paused_total;
    long long idle_since;

    /**
     * @brief Elapsed playback of current track in milliseconds
     */
    int64_t elapsed_ms (const long long now) const;
};

using snapshot_ptr_t = std::shared_ptr<const snapshot_t>;

/**
 * @brief Per guild playback state machine.
 *
 * Every mutating method is serialized with t_mutex. Resolution and
 * transmission run on their own threads and re-enter through the same lock,
 * tagged with the generation they were started for so stale completions are
 * discarded. Must be created with std::make_shared.
 */
class Session : public std::enable_shared_from_this<Session>
{
    std::mutex t_mutex;

    dpp::snowflake guild_id;
    session_config_t config;
    resolver_ptr_t resolver;
    driver_ptr_t driver;
    event_listener_t listener;

    std::deque<track_t> queue;
    std::optional<track_t> current_track;
    loop_mode_t loop_mode;
    session_status_t status;
    std::map<dpp::snowflake, float> volumes;
    dpp::snowflake voice_channel_id;
    // gateway reported us in voice_channel_id since last join
    bool voice_confirmed;

    long long started_at;
    long long paused_at;
    long long paused_total;
    long long idle_since;

    int consecutive_failures;
    // bumped on every track start, skip and stop
    uint64_t generation;
    cancel_token_ptr_t send_token;

    std::mutex snapshot_m;
    snapshot_ptr_t published;

    // ====== the methods below expect t_mutex to be held ======

    void publish_snapshot ();

    float get_gain (const dpp::snowflake &user_id) const;

    void cancel_send ();

    void start_current (std::vector<event_t> &events);

    void start_send (std::vector<event_t> &events);

    void advance (const bool skipped, std::vector<event_t> &events);

    void handle_failure (const track_t &failed, const std::string &reason,
                         std::vector<event_t> &events);

    void set_idle (const std::string &message, std::vector<event_t> &events);

    void stop_locked (std::vector<event_t> &events);

    // ====== background task entries ======

    void launch_resolve (const uint64_t gen, const track_t &request);

    void launch_send (const uint64_t gen, const track_t &track,
                      const cancel_token_ptr_t &token);

    void handle_resolved (const uint64_t gen, const track_t &resolved);

    void handle_resolve_failed (const uint64_t gen, const track_t &request,
                                const std::string &reason);

    void handle_send_done (const uint64_t gen, const track_t &track,
                           const stream_error_t result);

    void emit (const std::vector<event_t> &events);

  public:
    Session (const dpp::snowflake &guild_id, const session_config_t &config,
             resolver_ptr_t resolver, driver_ptr_t driver,
             event_listener_t listener = nullptr);

    ~Session ();

    const dpp::snowflake &get_guild_id () const;

    /**
     * @brief Append track to the queue, starts it when session is idle
     */
    command_status_t enqueue (const track_t &track);

    /**
     * @brief End current track early, treated as completion except a skipped
     * track is never replayed immediately
     */
    command_status_t skip ();

    command_status_t pause ();

    command_status_t resume ();

    /**
     * @brief Clear everything and disconnect, terminal
     */
    command_status_t stop ();

    /**
     * @brief Same as stop but doesn't emit session_stopped, for callers
     * holding a lock the listener may need
     *
     * @return bool true if this call stopped the session
     */
    bool shutdown ();

    command_status_t set_loop_mode (const loop_mode_t mode);

    /**
     * @brief Set user gain, clamped to configured range
     *
     * @param effective Receives the applied gain when not NULL
     */
    command_status_t set_volume (const dpp::snowflake &user_id,
                                 const float gain, float *effective = NULL);

    /**
     * @brief Connect to voice channel or move there if already connected
     */
    command_status_t join (const dpp::snowflake &voice_channel_id);

    /**
     * @brief Record voice channel reported by the gateway, either our own
     * join arriving or a move done outside of this session
     */
    command_status_t set_voice_channel (const dpp::snowflake &voice_channel_id);

    /**
     * @brief Joined a voice channel but the gateway hasn't reported us there
     * yet. A disconnect seen meanwhile belongs to an earlier connection.
     */
    bool is_joining ();

    /**
     * @brief Move queue[index] to the front then skip to it
     */
    command_status_t jump (const size_t index);

    command_status_t remove (const size_t index, track_t *removed = NULL);

    command_status_t shuffle ();

    /**
     * @brief Stop this session if it has been idle longer than configured.
     * Doesn't emit session_stopped, caller is responsible to report it.
     *
     * @param expired_now Set to true when this call stopped the session
     * @return bool true if session is stopped after this call
     */
    bool try_expire (const long long now, bool *expired_now = NULL);

    snapshot_ptr_t snapshot ();

    float clamp_volume (const float gain) const;
};

using session_ptr_t = std::shared_ptr<Session>;

class Registry
{
    std::mutex ps_m;
    std::map<dpp::snowflake, session_ptr_t> sessions;

    session_config_t config;
    resolver_ptr_t resolver;
    driver_factory_t driver_factory;

    std::mutex listener_m;
    event_listener_t listener;

    void dispatch_event (const event_t &event);

  public:
    Registry (const session_config_t &config, resolver_ptr_t resolver,
              driver_factory_t driver_factory);

    ~Registry ();

    /**
     * @brief Get session of guild, create one if there isn't any or the
     * existing one is stopped
     */
    session_ptr_t get_or_create (const dpp::snowflake &guild_id);

    /**
     * @brief Get session of guild
     *
     * @return session_ptr_t NULL if not found
     */
    session_ptr_t get (const dpp::snowflake &guild_id);

    /**
     * @brief Stop and forget session of guild. The session is stopped before
     * the registry lock is released so a new session of the guild never
     * overlaps it.
     *
     * @return bool false if not found
     */
    bool remove (const dpp::snowflake &guild_id);

    /**
     * @brief Remove every stopped session and every session idle for longer
     * than configured
     *
     * @return size_t Count of removed sessions
     */
    size_t sweep_idle (const long long now);

    /**
     * @brief Gateway reported the bot out of voice. Ignored while the
     * session is still joining, that's the echo of an earlier disconnect.
     */
    void handle_voice_disconnected (const dpp::snowflake &guild_id);

    /**
     * @brief Bot got moved to another voice channel by someone else
     */
    void handle_voice_moved (const dpp::snowflake &guild_id,
                             const dpp::snowflake &voice_channel_id);

    std::vector<dpp::snowflake> get_guild_ids ();

    void shutdown_all ();

    void set_event_listener (event_listener_t listener);

    const session_config_t &get_config () const;
};

using registry_ptr_t = std::shared_ptr<Registry>;

} // woot::player

#endif // WOOT_PLAYER_H
