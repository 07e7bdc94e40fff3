#include "woot/transmission.h"

namespace woot::player
{

const char *
stream_error_str (const stream_error_t err)
{
    switch (err)
        {
        case STREAM_OK:
            return "OK";
        case STREAM_CONNECTION_LOST:
            return "Voice connection lost";
        case STREAM_DECODE_FAILURE:
            return "Failed decoding audio stream";
        case STREAM_CANCELLED:
            return "Cancelled";
        }

    return "Unknown";
}

stream_error_t
get_decode_result (const stream_error_t result,
                   const int decoder_exit_status)
{
    if (result == STREAM_OK && decoder_exit_status != 0)
        return STREAM_DECODE_FAILURE;

    return result;
}

} // woot::player
