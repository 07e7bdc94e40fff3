#include "woot/track.h"
#include "woot/util.h"
#include <atomic>

namespace woot::player
{

static std::atomic<uint64_t> next_track_id{ 1 };

bool
stream_source_t::is_valid (const long long now, const long long ttl_ms) const
{
    if (url.empty ())
        return false;

    if (ttl_ms <= 0)
        return true;

    return (now - resolved_at) < util::ms_to_ns (ttl_ms);
}

bool
track_t::is_resolved () const
{
    return stream != nullptr;
}

track_t
create_track (const std::string &query, const dpp::snowflake &requested_by)
{
    track_t t = {};
    t.id = next_track_id++;
    t.query = query;
    t.title = query;
    t.duration = 0;
    t.requested_by = requested_by;

    return t;
}

track_t
merge_resolution (const track_t &request, const track_t &resolved)
{
    track_t t = resolved;
    t.id = request.id;
    t.query = request.query;
    t.requested_by = request.requested_by;

    return t;
}

} // woot::player
