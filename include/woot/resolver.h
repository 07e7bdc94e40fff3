#ifndef WOOT_RESOLVER_H
#define WOOT_RESOLVER_H

#include "woot/exception.h"
#include "woot/track.h"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace woot::player
{

enum resolution_error_kind_t
{
    RESOLUTION_TIMEOUT = 1,
    RESOLUTION_NOT_FOUND,
    RESOLUTION_EXTERNAL_TOOL_FAILURE,
};

const char *resolution_error_kind_str (const resolution_error_kind_t kind);

class resolution_error : public woot::exception
{
    resolution_error_kind_t k;

  public:
    resolution_error (const resolution_error_kind_t kind,
                      const std::string &_message);

    resolution_error_kind_t kind () const noexcept;
};

/**
 * @brief Turns a user query or media url into a playable track. Must be safe
 * to call concurrently from different sessions.
 *
 * @throw resolution_error
 */
class TrackResolver
{
  public:
    virtual ~TrackResolver () = default;

    virtual track_t resolve (const std::string &query) = 0;
};

using resolver_ptr_t = std::shared_ptr<TrackResolver>;

/**
 * @brief Pick a candidate index out of search results, candidates is never
 * empty
 */
using ranking_policy_t
    = std::function<size_t (const std::vector<nlohmann::json> &candidates)>;

size_t first_result (const std::vector<nlohmann::json> &candidates);

struct ytdlp_options_t
{
    std::string exe;
    long long timeout_ms;
    // how many results a search term fetches
    int search_candidates;
    ranking_policy_t ranking;
};

ytdlp_options_t get_ytdlp_options ();

class YTDLPResolver : public TrackResolver
{
    ytdlp_options_t options;

  public:
    YTDLPResolver (const ytdlp_options_t &options);

    track_t resolve (const std::string &query) override;
};

bool is_url (const std::string &query);

/**
 * @brief Build the argument yt-dlp receives for query
 */
std::string get_ytdlp_target (const std::string &query,
                              const int search_candidates);

/**
 * @brief Parse yt-dlp -j output, one json document per line
 *
 * @throw resolution_error RESOLUTION_EXTERNAL_TOOL_FAILURE on malformed line
 */
std::vector<nlohmann::json> parse_ytdlp_output (const std::string &out);

/**
 * @brief Create track from a yt-dlp entry
 *
 * @throw resolution_error RESOLUTION_EXTERNAL_TOOL_FAILURE when entry has no
 * stream url
 */
track_t track_from_ytdlp_entry (const nlohmann::json &entry,
                                const long long resolved_at);

} // woot::player

#endif // WOOT_RESOLVER_H
