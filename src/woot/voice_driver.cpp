#include "woot/voice_driver.h"
#include "woot/audio_processing.h"
#include "woot/child/worker.h"
#include "woot/util.h"
#include "woot/woot.h"
#include <errno.h>
#include <poll.h>
#include <set>
#include <string.h>
#include <thread>
#include <unistd.h>

namespace woot::player
{

static std::mutex reconnecting_m;
static std::set<dpp::snowflake> reconnecting_guilds;

struct reconnecting_marker_t
{
    dpp::snowflake guild_id;

    reconnecting_marker_t (const dpp::snowflake &guild_id)
        : guild_id (guild_id)
    {
        std::lock_guard lk (reconnecting_m);
        reconnecting_guilds.insert (guild_id);
    }

    ~reconnecting_marker_t ()
    {
        std::lock_guard lk (reconnecting_m);
        reconnecting_guilds.erase (guild_id);
    }
};

voice_driver_options_t
get_voice_driver_options ()
{
    voice_driver_options_t o;
    o.ffmpeg_exe = get_config_value<std::string> ("FFMPEG_EXE", "ffmpeg");
    o.ready_timeout_ms
        = get_config_value<long long> ("VOICE_READY_TIMEOUT_MS", 10000);
    o.reconnect_attempts
        = get_config_value<int> ("VOICE_RECONNECT_ATTEMPTS", 3);
    o.buffer_size = get_config_value<float> ("STREAM_BUFFER_SIZE", 0.3f);

    return o;
}

DppTransmissionDriver::DppTransmissionDriver (
    dpp::cluster *cluster, const dpp::snowflake &guild_id,
    const voice_driver_options_t &options)
    : cluster (cluster), guild_id (guild_id), options (options),
      channel_id (0), gain (1.0f), paused (false)
{
}

DppTransmissionDriver::~DppTransmissionDriver () {}

bool
DppTransmissionDriver::is_reconnecting (const dpp::snowflake &guild_id)
{
    std::lock_guard lk (reconnecting_m);
    return reconnecting_guilds.find (guild_id) != reconnecting_guilds.end ();
}

dpp::discord_client *
DppTransmissionDriver::get_shard ()
{
    if (!cluster)
        return NULL;

    dpp::guild *g = dpp::find_guild (guild_id);
    if (!g)
        {
            fprintf (stderr,
                     "[DppTransmissionDriver::get_shard ERROR] Guild not "
                     "cached: %ld\n",
                     (uint64_t)guild_id);
            return NULL;
        }

    return cluster->get_shard (g->shard_id);
}

dpp::discord_voice_client *
DppTransmissionDriver::get_voice_client ()
{
    dpp::discord_client *shard = get_shard ();
    if (!shard)
        return NULL;

    dpp::voiceconn *v = shard->get_voice (guild_id);
    if (!v || !v->voiceclient || v->voiceclient->terminating)
        return NULL;

    return v->voiceclient;
}

int
DppTransmissionDriver::connect (const dpp::snowflake &voice_channel_id)
{
    dpp::discord_client *shard = get_shard ();
    if (!shard)
        return 1;

    {
        std::lock_guard lk (m);
        channel_id = voice_channel_id;
    }

    // also moves the bot when it's already in another channel of the guild
    shard->connect_voice (guild_id, voice_channel_id, false, true);

    return 0;
}

int
DppTransmissionDriver::move (const dpp::snowflake &voice_channel_id)
{
    return connect (voice_channel_id);
}

void
DppTransmissionDriver::disconnect ()
{
    {
        std::lock_guard lk (m);
        channel_id = 0;
    }

    dpp::discord_client *shard = get_shard ();
    if (!shard)
        return;

    if (shard->get_voice (guild_id))
        shard->disconnect_voice (guild_id);
}

void
DppTransmissionDriver::set_gain (const float gain)
{
    this->gain = gain;
}

void
DppTransmissionDriver::set_paused (const bool paused)
{
    this->paused = paused;

    dpp::discord_voice_client *vc = get_voice_client ();
    if (vc)
        vc->pause_audio (paused);
}

bool
DppTransmissionDriver::is_connected ()
{
    dpp::discord_client *shard = get_shard ();
    if (!shard)
        return false;

    return shard->get_voice (guild_id) != NULL;
}

dpp::discord_voice_client *
DppTransmissionDriver::wait_for_voice (const cancel_token_ptr_t &token,
                                       const long long timeout_ms)
{
    const long long deadline
        = util::get_current_ts () + util::ms_to_ns (timeout_ms);

    while (!token->is_cancelled () && get_running_state ())
        {
            dpp::discord_voice_client *vc = get_voice_client ();
            if (vc && vc->is_ready ())
                {
                    if (paused)
                        vc->pause_audio (true);

                    return vc;
                }

            if (util::get_current_ts () > deadline)
                break;

            std::this_thread::sleep_for (std::chrono::milliseconds (100));
        }

    return NULL;
}

dpp::discord_voice_client *
DppTransmissionDriver::reconnect (const cancel_token_ptr_t &token)
{
    dpp::snowflake cid;
    {
        std::lock_guard lk (m);
        cid = channel_id;
    }

    if (!cid)
        return NULL;

    reconnecting_marker_t marker (guild_id);

    for (int attempt = 1; attempt <= options.reconnect_attempts; attempt++)
        {
            if (token->is_cancelled ())
                return NULL;

            dpp::discord_client *shard = get_shard ();
            if (!shard)
                return NULL;

            fprintf (stderr,
                     "[DppTransmissionDriver::reconnect] %ld: Attempt %d/%d\n",
                     (uint64_t)guild_id, attempt, options.reconnect_attempts);

            if (shard->get_voice (guild_id))
                {
                    shard->disconnect_voice (guild_id);
                    std::this_thread::sleep_for (
                        std::chrono::milliseconds (500));
                }

            {
                // disconnect () called meanwhile, don't come back
                std::lock_guard lk (m);
                if (!channel_id)
                    return NULL;
            }

            shard->connect_voice (guild_id, cid, false, true);

            dpp::discord_voice_client *vc
                = wait_for_voice (token, options.ready_timeout_ms);

            if (vc)
                return vc;
        }

    fprintf (stderr,
             "[DppTransmissionDriver::reconnect ERROR] %ld: Giving up after "
             "%d attempts\n",
             (uint64_t)guild_id, options.reconnect_attempts);

    return NULL;
}

int
DppTransmissionDriver::send_frame (dpp::discord_voice_client *vc,
                                   OpusEncoder *encoder, opus_int16 *pcm)
{
    audio_processing::apply_gain (pcm, FRAME_SIZE * CHANNELS, gain);

    uint8_t packet[OPUS_MAX_ENCODE_OUTPUT_SIZE];

    const opus_int32 len = opus_encode (encoder, pcm, FRAME_SIZE, packet,
                                        OPUS_MAX_ENCODE_OUTPUT_SIZE);

    if (len < 0)
        {
            fprintf (stderr,
                     "[DppTransmissionDriver::send_frame ERROR] "
                     "opus_encode() returned %d\n",
                     len);

            return len;
        }

    // 1-2 byte packet is DTX silence, nothing worth sending
    if (len > 2)
        {
            try
                {
                    vc->send_audio_opus (packet, len, FRAME_DURATION);
                }
            catch (const dpp::voice_exception &e)
                {
                    fprintf (stderr,
                             "[DppTransmissionDriver::send_frame ERROR] %s\n",
                             e.what ());

                    return 1;
                }
        }

    return 0;
}

stream_error_t
DppTransmissionDriver::send (const stream_source_t &source,
                             const cancel_token_ptr_t &token)
{
    const bool debug = get_debug_state ();

    std::lock_guard send_lk (send_m);

    dpp::discord_voice_client *vc
        = wait_for_voice (token, options.ready_timeout_ms);

    if (token->is_cancelled ())
        return STREAM_CANCELLED;

    if (!vc && !(vc = reconnect (token)))
        return token->is_cancelled () ? STREAM_CANCELLED
                                      : STREAM_CONNECTION_LOST;

    child::worker::child_process_t decoder = child::worker::spawn_reader (
        audio_processing::get_decoder_args (options.ffmpeg_exe, source.url,
                                            debug),
        false);

    if (decoder.pid == -1)
        return STREAM_DECODE_FAILURE;

    int error = 0;
    OpusEncoder *encoder = opus_encoder_create (SAMPLING_RATE, CHANNELS,
                                                OPUS_APPLICATION_AUDIO, &error);

    if (error != OPUS_OK || !encoder)
        {
            fprintf (stderr,
                     "[DppTransmissionDriver::send ERROR] "
                     "opus_encoder_create() failure: %d\n",
                     error);

            child::worker::close_valid_fd (&decoder.read_fd);
            child::worker::kill_and_reap (decoder.pid);

            return STREAM_DECODE_FAILURE;
        }

    opus_int16 pcm[ENCODE_BUFFER_SIZE / sizeof (opus_int16)];
    size_t filled = 0;
    size_t frames_sent = 0;

    stream_error_t result = STREAM_OK;
    bool eof = false;

    struct pollfd pfd[1];
    pfd[0].fd = decoder.read_fd;
    pfd[0].events = POLLIN;

    while (!eof)
        {
            if (token->is_cancelled () || !get_running_state ())
                {
                    result = STREAM_CANCELLED;
                    break;
                }

            int has_event = poll (pfd, 1, 100);
            if (has_event == -1)
                {
                    if (errno == EINTR)
                        continue;

                    perror ("[DppTransmissionDriver::send ERROR] poll");
                    eof = true;
                    break;
                }

            if (has_event == 0)
                continue;

            ssize_t read_size
                = read (decoder.read_fd, (uint8_t *)pcm + filled,
                        ENCODE_BUFFER_SIZE - filled);

            if (read_size == -1 && errno == EINTR)
                continue;

            if (read_size <= 0)
                {
                    if (read_size < 0)
                        perror ("[DppTransmissionDriver::send ERROR] read");

                    eof = true;
                    break;
                }

            filled += read_size;
            if (filled < ENCODE_BUFFER_SIZE)
                continue;

            filled = 0;

            // voice client went away, try to get it back before giving up
            if (vc != get_voice_client ())
                {
                    vc = get_voice_client ();
                    if (!vc && !(vc = reconnect (token)))
                        {
                            result = token->is_cancelled ()
                                         ? STREAM_CANCELLED
                                         : STREAM_CONNECTION_LOST;
                            break;
                        }
                }

            if (send_frame (vc, encoder, pcm) != 0)
                {
                    vc = reconnect (token);
                    if (!vc)
                        {
                            result = token->is_cancelled ()
                                         ? STREAM_CANCELLED
                                         : STREAM_CONNECTION_LOST;
                            break;
                        }
                }

            frames_sent++;

            while (!token->is_cancelled () && get_running_state ()
                   && !vc->terminating
                   && vc->get_secs_remaining () > options.buffer_size)
                {
                    std::this_thread::sleep_for (
                        std::chrono::milliseconds (20));
                }
        }

    // last partial frame, pad with silence
    if (result == STREAM_OK && filled > 0 && vc)
        {
            memset ((uint8_t *)pcm + filled, 0, ENCODE_BUFFER_SIZE - filled);
            if (send_frame (vc, encoder, pcm) == 0)
                frames_sent++;
        }

    opus_encoder_destroy (encoder);
    encoder = NULL;

    child::worker::close_valid_fd (&decoder.read_fd);

    int exit_status;
    if (result == STREAM_OK)
        exit_status = child::worker::call_waitpid (decoder.pid);
    else
        exit_status = child::worker::kill_and_reap (decoder.pid);

    if (debug)
        fprintf (stderr,
                 "[DppTransmissionDriver::send] %ld: Decoder exited %d, %ld "
                 "frames sent\n",
                 (uint64_t)guild_id, exit_status, frames_sent);

    // let the voice client play what's buffered, paused keeps it buffered
    while (result == STREAM_OK && get_running_state ())
        {
            if (token->is_cancelled ())
                {
                    result = STREAM_CANCELLED;
                    break;
                }

            dpp::discord_voice_client *cvc = get_voice_client ();
            if (!cvc || cvc->get_secs_remaining () < 0.05f)
                break;

            std::this_thread::sleep_for (std::chrono::milliseconds (50));
        }

    if (result == STREAM_CANCELLED)
        {
            dpp::discord_voice_client *cvc = get_voice_client ();
            if (cvc)
                cvc->stop_audio ();
        }

    return get_decode_result (result, exit_status);
}

driver_factory_t
create_dpp_driver_factory (dpp::cluster *cluster)
{
    voice_driver_options_t options = get_voice_driver_options ();

    return [cluster, options] (const dpp::snowflake &guild_id) {
        return std::make_shared<DppTransmissionDriver> (cluster, guild_id,
                                                        options);
    };
}

} // woot::player
