#ifndef WOOT_TRACK_H
#define WOOT_TRACK_H

#include <dpp/snowflake.h>
#include <memory>
#include <stdint.h>
#include <string>

namespace woot::player
{

/**
 * @brief Resolved audio stream, never modified once created
 */
struct stream_source_t
{
    // direct media url the transcoder reads incrementally
    std::string url;
    std::string webpage_url;
    std::string thumbnail;
    // util::get_current_ts () of resolution
    long long resolved_at;

    /**
     * @brief Whether url can still be read, ttl_ms of 0 never expires
     */
    bool is_valid (const long long now, const long long ttl_ms) const;
};

using stream_source_ptr_t = std::shared_ptr<const stream_source_t>;

struct track_t
{
    uint64_t id;
    // what the user asked for, url or search term
    std::string query;
    std::string title;
    // milliseconds, 0 when unknown (live streams)
    uint64_t duration;
    dpp::snowflake requested_by;
    // NULL until resolved
    stream_source_ptr_t stream;

    bool is_resolved () const;
};

/**
 * @brief Create an unresolved track request with a new unique id. Title is
 * the query until the track is resolved.
 */
track_t create_track (const std::string &query,
                      const dpp::snowflake &requested_by);

/**
 * @brief Combine resolver output with the identity of the request it was
 * resolved from
 */
track_t merge_resolution (const track_t &request, const track_t &resolved);

} // woot::player

#endif // WOOT_TRACK_H
