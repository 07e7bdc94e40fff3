#ifndef WOOT_TRANSMISSION_H
#define WOOT_TRANSMISSION_H

#include "woot/track.h"
#include <atomic>
#include <dpp/snowflake.h>
#include <functional>
#include <memory>

namespace woot::player
{

enum stream_error_t
{
    STREAM_OK = 0,
    // voice transport dropped and couldn't be recovered
    STREAM_CONNECTION_LOST,
    // transcoder couldn't start or exited with failure, even mid track
    STREAM_DECODE_FAILURE,
    STREAM_CANCELLED,
};

const char *stream_error_str (const stream_error_t err);

/**
 * @brief Final result of a send once the decoder process has been reaped.
 * A transport that ran out of input is only OK when the decoder exited
 * cleanly.
 */
stream_error_t get_decode_result (const stream_error_t result,
                                  const int decoder_exit_status);

struct cancel_token_t
{
    std::atomic<bool> cancelled{ false };

    void
    cancel ()
    {
        cancelled = true;
    }

    bool
    is_cancelled () const
    {
        return cancelled;
    }
};

using cancel_token_ptr_t = std::shared_ptr<cancel_token_t>;

/**
 * @brief Audio transport owned by exactly one Session.
 *
 * Control methods (connect, move, disconnect, set_gain, set_paused) must
 * return promptly, they are called with the session lock held. send blocks
 * the calling thread until the stream is exhausted, the token is cancelled or
 * transport fails.
 */
class TransmissionDriver
{
  public:
    virtual ~TransmissionDriver () = default;

    virtual int connect (const dpp::snowflake &voice_channel_id) = 0;

    virtual int move (const dpp::snowflake &voice_channel_id) = 0;

    virtual void disconnect () = 0;

    virtual stream_error_t send (const stream_source_t &source,
                                 const cancel_token_ptr_t &token)
        = 0;

    virtual void set_gain (const float gain) = 0;

    virtual void set_paused (const bool paused) = 0;

    virtual bool is_connected () = 0;
};

using driver_ptr_t = std::shared_ptr<TransmissionDriver>;

using driver_factory_t
    = std::function<driver_ptr_t (const dpp::snowflake &guild_id)>;

} // woot::player

#endif // WOOT_TRANSMISSION_H
