#ifndef WOOT_VOICE_DRIVER_H
#define WOOT_VOICE_DRIVER_H

#include "woot/transmission.h"
#include <atomic>
#include <dpp/dpp.h>
#include <mutex>
#include <opus/opus.h>

namespace woot::player
{

struct voice_driver_options_t
{
    std::string ffmpeg_exe;
    long long ready_timeout_ms;
    int reconnect_attempts;
    // seconds of audio DPP may hold before we stop feeding it
    float buffer_size;
};

voice_driver_options_t get_voice_driver_options ();

/**
 * @brief Transmission driver on top of DPP voice client. Decodes the stream
 * with a forked ffmpeg into PCM, applies gain, encodes to opus and feeds the
 * voice client.
 */
class DppTransmissionDriver : public TransmissionDriver
{
    dpp::cluster *cluster;
    dpp::snowflake guild_id;
    voice_driver_options_t options;

    std::mutex m;
    dpp::snowflake channel_id;

    // one stream at a time, a cancelled send clears the voice buffer before
    // the next one starts feeding it
    std::mutex send_m;

    std::atomic<float> gain;
    std::atomic<bool> paused;

    dpp::discord_client *get_shard ();

    dpp::discord_voice_client *get_voice_client ();

    /**
     * @brief Poll until voice client of this guild is ready
     *
     * @return NULL on timeout or cancelled
     */
    dpp::discord_voice_client *wait_for_voice (const cancel_token_ptr_t &token,
                                               const long long timeout_ms);

    /**
     * @brief Drop and reestablish voice connection, bounded by configured
     * attempts
     *
     * @return NULL when every attempt failed
     */
    dpp::discord_voice_client *reconnect (const cancel_token_ptr_t &token);

    int send_frame (dpp::discord_voice_client *vc, OpusEncoder *encoder,
                    opus_int16 *pcm);

  public:
    DppTransmissionDriver (dpp::cluster *cluster,
                           const dpp::snowflake &guild_id,
                           const voice_driver_options_t &options);

    ~DppTransmissionDriver ();

    int connect (const dpp::snowflake &voice_channel_id) override;

    int move (const dpp::snowflake &voice_channel_id) override;

    void disconnect () override;

    stream_error_t send (const stream_source_t &source,
                         const cancel_token_ptr_t &token) override;

    void set_gain (const float gain) override;

    void set_paused (const bool paused) override;

    bool is_connected () override;

    /**
     * @brief Whether a driver is dropping voice connection of guild_id on
     * purpose to reconnect, voice state updates during it aren't a removal
     */
    static bool is_reconnecting (const dpp::snowflake &guild_id);
};

driver_factory_t create_dpp_driver_factory (dpp::cluster *cluster);

} // woot::player

#endif // WOOT_VOICE_DRIVER_H
