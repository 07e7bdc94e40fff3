#include "woot/spotify.h"
#include "woot/util.h"
#include "woot/woot.h"
#include <curlpp/Easy.hpp>
#include <curlpp/Exception.hpp>
#include <curlpp/Infos.hpp>
#include <curlpp/Options.hpp>
#include <regex>
#include <sstream>

namespace woot::spotify
{

link_t
parse_link (const std::string &query)
{
    static const std::regex link_re (
        "(?:open\\.spotify\\.com/(?:intl-[A-Za-z-]+/)?|spotify:)"
        "(track|album|playlist)[/:]([A-Za-z0-9]+)");

    std::smatch m;
    if (!std::regex_search (query, m, link_re))
        return { LINK_NONE, "" };

    const std::string kind = m[1].str ();

    if (kind == "track")
        return { LINK_TRACK, m[2].str () };

    if (kind == "album")
        return { LINK_ALBUM, m[2].str () };

    return { LINK_PLAYLIST, m[2].str () };
}

bool
credentials_t::is_set () const
{
    return !client_id.empty () && !client_secret.empty ();
}

credentials_t
get_credentials ()
{
    return { get_config_value<std::string> ("SPOTIFY_CLIENT_ID", ""),
             get_config_value<std::string> ("SPOTIFY_CLIENT_SECRET", "") };
}

api_error::api_error (const std::string &_message, int _code)
    : woot::exception (_message, _code)
{
}

// ================= TRANSPORT =================

CurlppTransport::CurlppTransport (const long timeout_ms)
    : timeout_ms (timeout_ms)
{
}

http_response_t
CurlppTransport::request_token (const credentials_t &credentials)
{
    std::ostringstream os;

    curlpp::Easy req;

    const std::string fields = "grant_type=client_credentials";

    req.setOpt (curlpp::options::Url (WOOT_SPOTIFY_ACCOUNTS_URL));
    req.setOpt (curlpp::options::UserPwd (credentials.client_id + ':'
                                          + credentials.client_secret));

    req.setOpt (curlpp::options::PostFields (fields));
    req.setOpt (curlpp::options::PostFieldSize (fields.length ()));

    req.setOpt (curlpp::options::TimeoutMs (timeout_ms));
    req.setOpt (curlpp::options::WriteStream (&os));

    try
        {
            req.perform ();
        }
    catch (const curlpp::LibcurlRuntimeError &e)
        {
            fprintf (stderr,
                     "[spotify::CurlppTransport::request_token ERROR] "
                     "LibcurlRuntimeError(%d): %s\n",
                     e.whatCode (), e.what ());

            return { false, 0, "" };
        }

    return { true, curlpp::Infos::ResponseCode::get (req), os.str () };
}

http_response_t
CurlppTransport::get (const std::string &url, const std::string &access_token)
{
    std::ostringstream os;

    curlpp::Easy req;

    req.setOpt (curlpp::options::Url (url));

    std::string header = "Authorization: Bearer " + access_token;

    req.setOpt (curlpp::options::HttpHeader ({ header }));

    req.setOpt (curlpp::options::TimeoutMs (timeout_ms));
    req.setOpt (curlpp::options::WriteStream (&os));

    try
        {
            req.perform ();
        }
    catch (const curlpp::LibcurlRuntimeError &e)
        {
            fprintf (stderr,
                     "[spotify::CurlppTransport::get ERROR] "
                     "LibcurlRuntimeError(%d): %s\n",
                     e.whatCode (), e.what ());

            return { false, 0, "" };
        }

    return { true, curlpp::Infos::ResponseCode::get (req), os.str () };
}

// ================= API OBJECTS =================

namespace
{

std::string
trim (const std::string &str)
{
    static const char ws[] = " \t\r\n";

    const size_t start = str.find_first_not_of (ws);
    if (start == std::string::npos)
        return "";

    return str.substr (start, str.find_last_not_of (ws) - start + 1);
}

std::string
get_string (const nlohmann::json &obj, const char *key)
{
    if (!obj.is_object ())
        return "";

    auto i = obj.find (key);
    if (i == obj.end () || !i->is_string ())
        return "";

    return trim (i->get<std::string> ());
}

player::track_t
make_request (const std::string &name, const std::string &artists,
              const dpp::snowflake &requested_by,
              const std::string &title_suffix)
{
    const std::string query
        = artists.empty () ? name : name + ' ' + artists;

    player::track_t t = player::create_track (query, requested_by);

    t.title = artists.empty () ? name : name + " - " + artists;
    t.title += title_suffix;

    return t;
}

uint64_t
get_duration (const nlohmann::json &obj)
{
    auto i = obj.find ("duration_ms");
    if (i == obj.end () || !i->is_number_unsigned ())
        return 0;

    return i->get<uint64_t> ();
}

} // namespace

std::string
get_artists (const nlohmann::json &artists)
{
    if (!artists.is_array ())
        return "";

    std::string ret;

    for (const auto &a : artists)
        {
            const std::string name = get_string (a, "name");
            if (name.empty ())
                continue;

            if (!ret.empty ())
                ret += ", ";

            ret += name;
        }

    return ret;
}

bool
track_from_api_object (const nlohmann::json &obj,
                       const dpp::snowflake &requested_by,
                       player::track_t &out, const std::string &title_suffix)
{
    if (!obj.is_object ())
        return false;

    const std::string name = get_string (obj, "name");
    const std::string artists
        = obj.contains ("artists") ? get_artists (obj["artists"]) : "";

    // local files and podcast episodes, nothing to search for
    if (name.empty () || artists.empty ())
        return false;

    out = make_request (name, artists, requested_by, title_suffix);
    out.duration = get_duration (obj);

    return true;
}

std::string
tracks_from_page (const nlohmann::json &page,
                  const dpp::snowflake &requested_by,
                  std::vector<player::track_t> &out,
                  const std::string &title_suffix)
{
    if (!page.is_object ())
        return "";

    auto items = page.find ("items");
    if (items != page.end () && items->is_array ())
        for (const auto &item : *items)
            {
                // playlist items wrap the track, album tracks don't
                const nlohmann::json &obj
                    = item.is_object () && item.contains ("track")
                          ? item["track"]
                          : item;

                player::track_t t;
                if (track_from_api_object (obj, requested_by, t,
                                           title_suffix))
                    out.push_back (t);
            }

    return get_string (page, "next");
}

// ================= EXPANDER =================

Expander::Expander (const credentials_t &credentials,
                    transport_ptr_t transport, const size_t max_tracks)
    : credentials (credentials), transport (transport),
      max_tracks (max_tracks), token_expires_at (0)
{
}

bool
Expander::is_configured () const
{
    return credentials.is_set () && transport;
}

std::string
Expander::get_access_token (const bool refresh)
{
    std::lock_guard lk (token_m);

    const long long now = util::get_current_ts ();

    if (!refresh && !access_token.empty () && now < token_expires_at)
        return access_token;

    http_response_t resp = transport->request_token (credentials);

    if (!resp.performed)
        throw api_error ("Can't reach Spotify right now");

    if (resp.status != 200L)
        {
            fprintf (stderr,
                     "[spotify::Expander::get_access_token ERROR] Status: "
                     "%ld\n%s\n",
                     resp.status, resp.body.c_str ());

            throw api_error ("Spotify refused the configured credentials",
                             (int)resp.status);
        }

    nlohmann::json data = nlohmann::json::parse (resp.body, nullptr, false);

    const std::string token = get_string (data, "access_token");
    if (token.empty ())
        throw api_error ("Unknown token response from Spotify");

    long long expires_in = 3600;
    if (data["expires_in"].is_number_integer ())
        expires_in = data["expires_in"].get<long long> ();

    // renew a minute early, a request may be in flight when it expires
    expires_in = expires_in > 60 ? expires_in - 60 : 0;

    access_token = token;
    token_expires_at = now + util::ms_to_ns (expires_in * 1000);

    return access_token;
}

nlohmann::json
Expander::get_json (const std::string &url)
{
    const bool debug = get_debug_state ();

    if (debug)
        fprintf (stderr, "[spotify::Expander::get_json] GET %s\n",
                 url.c_str ());

    http_response_t resp = transport->get (url, get_access_token (false));

    // token revoked before its expiry, retry once with a fresh one
    if (resp.performed && resp.status == 401L)
        resp = transport->get (url, get_access_token (true));

    if (!resp.performed)
        throw api_error ("Can't reach Spotify right now");

    if (resp.status == 404L || resp.status == 400L)
        throw api_error ("Spotify doesn't know that link", (int)resp.status);

    if (resp.status != 200L)
        {
            fprintf (stderr,
                     "[spotify::Expander::get_json ERROR] Status: %ld\n%s\n",
                     resp.status, resp.body.c_str ());

            throw api_error ("Spotify request failed with status "
                                 + std::to_string (resp.status),
                             (int)resp.status);
        }

    nlohmann::json data = nlohmann::json::parse (resp.body, nullptr, false);

    if (!data.is_object ())
        {
            fprintf (stderr,
                     "[spotify::Expander::get_json ERROR] Unknown response: "
                     "%s\n",
                     resp.body.c_str ());

            throw api_error ("Unknown response from Spotify");
        }

    return data;
}

void
Expander::collect_pages (std::string url, const dpp::snowflake &requested_by,
                         std::vector<player::track_t> &out,
                         const std::string &title_suffix)
{
    while (!url.empty () && out.size () < max_tracks)
        {
            url = tracks_from_page (get_json (url), requested_by, out,
                                    title_suffix);
        }
}

std::vector<player::track_t>
Expander::expand (const link_t &link, const dpp::snowflake &requested_by)
{
    if (!is_configured ())
        throw api_error ("Spotify isn't configured (set SPOTIFY_CLIENT_ID and "
                         "SPOTIFY_CLIENT_SECRET)");

    if (link.kind == LINK_NONE || link.id.empty ())
        throw api_error ("Invalid Spotify link");

    std::vector<player::track_t> tracks;

    switch (link.kind)
        {
        case LINK_TRACK:
            {
                nlohmann::json t
                    = get_json (WOOT_SPOTIFY_API_URL "/tracks/" + link.id);

                std::string name = get_string (t, "name");
                if (name.empty ())
                    name = "Unknown";

                player::track_t request = make_request (
                    name,
                    t.contains ("artists") ? get_artists (t["artists"]) : "",
                    requested_by, "");
                request.duration = get_duration (t);

                tracks.push_back (request);
                break;
            }

        case LINK_ALBUM:
            {
                nlohmann::json album
                    = get_json (WOOT_SPOTIFY_API_URL "/albums/" + link.id);

                std::string album_name = get_string (album, "name");
                if (album_name.empty ())
                    album_name = "Album";

                const std::string suffix = " (" + album_name + ")";

                // album object carries the first page of its tracks
                std::string next
                    = album.contains ("tracks")
                          ? tracks_from_page (album["tracks"], requested_by,
                                              tracks, suffix)
                          : WOOT_SPOTIFY_API_URL "/albums/" + link.id
                                + "/tracks?limit=50";

                collect_pages (next, requested_by, tracks, suffix);
                break;
            }

        case LINK_PLAYLIST:
            collect_pages (WOOT_SPOTIFY_API_URL "/playlists/" + link.id
                               + "/tracks?limit=100&offset=0",
                           requested_by, tracks, "");
            break;

        case LINK_NONE:
            break;
        }

    if (tracks.size () > max_tracks)
        tracks.resize (max_tracks);

    if (tracks.empty ())
        throw api_error ("No playable track found in that link");

    if (get_debug_state ())
        fprintf (stderr, "[spotify::Expander::expand] %s: %ld tracks\n",
                 link.id.c_str (), tracks.size ());

    return tracks;
}

expander_ptr_t
create_expander ()
{
    const long long timeout_ms
        = get_config_value<long long> ("SPOTIFY_TIMEOUT_MS", 10000);
    const int64_t max_tracks
        = get_config_value<int64_t> ("SPOTIFY_MAX_TRACKS", 500);

    return std::make_shared<Expander> (
        get_credentials (), std::make_shared<CurlppTransport> (timeout_ms),
        max_tracks > 0 ? (size_t)max_tracks : 1);
}

} // woot::spotify
