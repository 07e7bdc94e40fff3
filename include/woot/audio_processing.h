#ifndef WOOT_AUDIO_PROCESSING_H
#define WOOT_AUDIO_PROCESSING_H

#include <cstddef>
#include <opus/opus_types.h>
#include <string>
#include <vector>

#define FRAME_DURATION 20
#define ENCODE_BUFFER_SIZE opus_encode_buffer_size
#define FRAME_SIZE opus_frame_size

// this is the recommended value for encoded opus output buffer size
// https://www.opus-codec.org/docs/html_api/group__opusencoder.html
#define OPUS_MAX_ENCODE_OUTPUT_SIZE 1276

#define FORMAT_USING_PCM "-f", "s16le"
#define OUT_CMD "pipe:1"

inline constexpr const int SAMPLING_RATE = 48000;
inline constexpr const int CHANNELS = 2;

inline constexpr const size_t opus_frame_size
    = FRAME_DURATION * (SAMPLING_RATE / 1000);
// FRAME_SIZE * channel * sizeof (opus_int16)
inline constexpr const size_t opus_encode_buffer_size
    = FRAME_SIZE * CHANNELS * sizeof (opus_int16);

namespace woot::audio_processing
{

/**
 * @brief Scale interleaved s16 samples in place, saturating on overflow
 */
void apply_gain (opus_int16 *samples, const size_t count, const float gain);

/**
 * @brief Arguments to transcode url into raw s16le 48k stereo on stdout
 */
std::vector<std::string> get_decoder_args (const std::string &ffmpeg_exe,
                                           const std::string &url,
                                           const bool debug = false);

} // woot::audio_processing

#endif // WOOT_AUDIO_PROCESSING_H
