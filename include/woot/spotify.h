#ifndef WOOT_SPOTIFY_H
#define WOOT_SPOTIFY_H

#include "woot/exception.h"
#include "woot/track.h"
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#define WOOT_SPOTIFY_ACCOUNTS_URL "https://accounts.spotify.com/api/token"
#define WOOT_SPOTIFY_API_URL "https://api.spotify.com/v1"

namespace woot::spotify
{

enum link_kind_t
{
    LINK_NONE,
    LINK_TRACK,
    LINK_ALBUM,
    LINK_PLAYLIST,
};

struct link_t
{
    link_kind_t kind;
    std::string id;
};

/**
 * @brief Find a Spotify track, album or playlist reference in query, either
 * open.spotify.com url or spotify: uri
 *
 * @return link_t kind is LINK_NONE when query isn't a Spotify link
 */
link_t parse_link (const std::string &query);

struct credentials_t
{
    std::string client_id;
    std::string client_secret;

    bool is_set () const;
};

/**
 * @brief Read SPOTIFY_CLIENT_ID and SPOTIFY_CLIENT_SECRET from config
 */
credentials_t get_credentials ();

class api_error : public woot::exception
{
  public:
    api_error (const std::string &_message, int _code = 0);
};

struct http_response_t
{
    bool performed;
    long status;
    std::string body;
};

/**
 * @brief HTTP side of the Web API client. Must be safe to call concurrently.
 */
class ApiTransport
{
  public:
    virtual ~ApiTransport () = default;

    /**
     * @brief Client credentials grant
     */
    virtual http_response_t request_token (const credentials_t &credentials)
        = 0;

    virtual http_response_t get (const std::string &url,
                                 const std::string &access_token)
        = 0;
};

using transport_ptr_t = std::shared_ptr<ApiTransport>;

class CurlppTransport : public ApiTransport
{
    long timeout_ms;

  public:
    explicit CurlppTransport (const long timeout_ms);

    http_response_t request_token (const credentials_t &credentials) override;

    http_response_t get (const std::string &url,
                         const std::string &access_token) override;
};

/**
 * @brief Join names of artist objects with ", ", blank names skipped
 */
std::string get_artists (const nlohmann::json &artists);

/**
 * @brief Track request searching "name artists", titled "name - artists"
 * until it's resolved
 *
 * @param title_suffix Appended to title, eg. album name
 * @return bool false when name or artists are missing
 */
bool track_from_api_object (const nlohmann::json &obj,
                            const dpp::snowflake &requested_by,
                            player::track_t &out,
                            const std::string &title_suffix = "");

/**
 * @brief Collect track requests out of a paging object of album tracks or
 * playlist items
 *
 * @return std::string url of next page, empty on last page
 */
std::string tracks_from_page (const nlohmann::json &page,
                              const dpp::snowflake &requested_by,
                              std::vector<player::track_t> &out,
                              const std::string &title_suffix = "");

/**
 * @brief Turns Spotify links into track requests the resolver can search
 * for. Caches the access token until it expires.
 *
 * @throw api_error
 */
class Expander
{
    credentials_t credentials;
    transport_ptr_t transport;
    size_t max_tracks;

    std::mutex token_m;
    std::string access_token;
    long long token_expires_at;

    std::string get_access_token (const bool refresh);

    nlohmann::json get_json (const std::string &url);

    void collect_pages (std::string url, const dpp::snowflake &requested_by,
                        std::vector<player::track_t> &out,
                        const std::string &title_suffix);

  public:
    Expander (const credentials_t &credentials, transport_ptr_t transport,
              const size_t max_tracks = 500);

    bool is_configured () const;

    /**
     * @brief Fetch every track link refers to, in order
     */
    std::vector<player::track_t> expand (const link_t &link,
                                         const dpp::snowflake &requested_by);
};

using expander_ptr_t = std::shared_ptr<Expander>;

/**
 * @brief Expander configured from config file
 */
expander_ptr_t create_expander ();

} // woot::spotify

#endif // WOOT_SPOTIFY_H
