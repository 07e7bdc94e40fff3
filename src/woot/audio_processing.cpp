#include "woot/audio_processing.h"
#include <cmath>

namespace woot::audio_processing
{

void
apply_gain (opus_int16 *samples, const size_t count, const float gain)
{
    // unity gain, nothing to do
    if (std::fabs (gain - 1.0f) < 0.0001f)
        return;

    for (size_t i = 0; i < count; i++)
        {
            const float v = (float)samples[i] * gain;

            if (v > 32767.0f)
                samples[i] = 32767;
            else if (v < -32768.0f)
                samples[i] = -32768;
            else
                samples[i] = (opus_int16)v;
        }
}

std::vector<std::string>
get_decoder_args (const std::string &ffmpeg_exe, const std::string &url,
                  const bool debug)
{
    return { ffmpeg_exe,
             "-reconnect",
             "1",
             "-reconnect_streamed",
             "1",
             "-reconnect_delay_max",
             "5",
             "-i",
             url,
             "-vn",
             "-ac",
             std::to_string (CHANNELS),
             "-ar",
             std::to_string (SAMPLING_RATE),
             FORMAT_USING_PCM,
             "-loglevel",
             debug ? "warning" : "error",
             OUT_CMD };
}

} // woot::audio_processing
