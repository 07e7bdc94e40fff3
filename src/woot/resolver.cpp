#include "woot/resolver.h"
#include "woot/child/worker.h"
#include "woot/util.h"
#include "woot/woot.h"
#include <errno.h>
#include <poll.h>
#include <regex>
#include <sstream>
#include <stdio.h>
#include <unistd.h>

namespace woot::player
{

const char *
resolution_error_kind_str (const resolution_error_kind_t kind)
{
    switch (kind)
        {
        case RESOLUTION_TIMEOUT:
            return "Timeout";
        case RESOLUTION_NOT_FOUND:
            return "NotFound";
        case RESOLUTION_EXTERNAL_TOOL_FAILURE:
            return "ExternalToolFailure";
        }

    return "Unknown";
}

resolution_error::resolution_error (const resolution_error_kind_t kind,
                                    const std::string &_message)
    : woot::exception (_message, kind), k (kind)
{
}

resolution_error_kind_t
resolution_error::kind () const noexcept
{
    return k;
}

size_t
first_result (const std::vector<nlohmann::json> &)
{
    return 0;
}

bool
is_url (const std::string &query)
{
    static const std::regex url_re ("^https?://\\S+$",
                                    std::regex_constants::icase);

    return std::regex_match (query, url_re);
}

std::string
get_ytdlp_target (const std::string &query, const int search_candidates)
{
    if (is_url (query))
        return query;

    return "ytsearch"
           + std::to_string (search_candidates > 0 ? search_candidates : 1)
           + ":" + query;
}

std::vector<nlohmann::json>
parse_ytdlp_output (const std::string &out)
{
    std::vector<nlohmann::json> ret;

    std::istringstream ss (out);
    std::string line;
    while (std::getline (ss, line))
        {
            if (line.find_first_not_of (" \t\r") == std::string::npos)
                continue;

            try
                {
                    ret.push_back (nlohmann::json::parse (line));
                }
            catch (const nlohmann::json::exception &e)
                {
                    throw resolution_error (
                        RESOLUTION_EXTERNAL_TOOL_FAILURE,
                        std::string ("Malformed yt-dlp output: ")
                            + e.what ());
                }
        }

    return ret;
}

track_t
track_from_ytdlp_entry (const nlohmann::json &entry,
                        const long long resolved_at)
{
    if (!entry.is_object ())
        throw resolution_error (RESOLUTION_EXTERNAL_TOOL_FAILURE,
                                "yt-dlp entry isn't an object");

    auto url = entry.find ("url");
    if (url == entry.end () || !url->is_string ()
        || url->get<std::string> ().empty ())
        throw resolution_error (RESOLUTION_EXTERNAL_TOOL_FAILURE,
                                "No stream URL found");

    track_t ret = {};

    auto title = entry.find ("title");
    ret.title = title != entry.end () && title->is_string ()
                    ? title->get<std::string> ()
                    : "Unknown Title";

    auto duration = entry.find ("duration");
    if (duration != entry.end () && duration->is_number ())
        ret.duration = (uint64_t)(duration->get<double> () * 1000.0);

    auto source = std::make_shared<stream_source_t> ();
    source->url = url->get<std::string> ();
    source->webpage_url = entry.value ("webpage_url", std::string ());
    source->thumbnail = entry.value ("thumbnail", std::string ());
    source->resolved_at = resolved_at;

    ret.stream = source;

    return ret;
}

ytdlp_options_t
get_ytdlp_options ()
{
    ytdlp_options_t o;
    o.exe = get_config_value<std::string> ("YTDLP_EXE", "yt-dlp");
    o.timeout_ms = get_config_value<long long> ("RESOLVE_TIMEOUT_MS", 30000);
    o.search_candidates = get_config_value<int> ("SEARCH_CANDIDATES", 1);
    o.ranking = first_result;

    if (o.search_candidates < 1)
        o.search_candidates = 1;

    return o;
}

YTDLPResolver::YTDLPResolver (const ytdlp_options_t &options)
    : options (options)
{
    if (!this->options.ranking)
        this->options.ranking = first_result;
}

track_t
YTDLPResolver::resolve (const std::string &query)
{
    const bool debug = get_debug_state ();
    const std::string target
        = get_ytdlp_target (query, options.search_candidates);

    const std::vector<std::string> args
        = { options.exe,        "-j",        "--no-playlist", "--no-warnings",
            "-f",               "bestaudio/best", "--",       target };

    child::worker::child_process_t child
        = child::worker::spawn_reader (args, !debug);

    if (child.pid == -1)
        throw resolution_error (RESOLUTION_EXTERNAL_TOOL_FAILURE,
                                "Failed to spawn " + options.exe);

    if (debug)
        fprintf (stderr, "[YTDLPResolver::resolve] %d: %s\n", child.pid,
                 target.c_str ());

    const long long deadline
        = util::get_current_ts () + util::ms_to_ns (options.timeout_ms);

    std::string out;
    bool timed_out = false;
    bool read_error = false;

    struct pollfd pfd[1];
    pfd[0].fd = child.read_fd;
    pfd[0].events = POLLIN;

    char buf[4096];
    while (true)
        {
            const long long remaining
                = util::ns_to_ms (deadline - util::get_current_ts ());

            if (remaining <= 0)
                {
                    timed_out = true;
                    break;
                }

            int has_event = poll (pfd, 1, remaining > 100 ? 100 : remaining);
            if (has_event == -1)
                {
                    if (errno == EINTR)
                        continue;

                    perror ("[YTDLPResolver::resolve ERROR] poll");
                    read_error = true;
                    break;
                }

            if (has_event == 0)
                continue;

            ssize_t read_size = read (child.read_fd, buf, sizeof (buf));
            if (read_size == -1 && errno == EINTR)
                continue;

            if (read_size < 0)
                {
                    perror ("[YTDLPResolver::resolve ERROR] read");
                    read_error = true;
                    break;
                }

            // EOF
            if (read_size == 0)
                break;

            out.append (buf, read_size);
        }

    child::worker::close_valid_fd (&child.read_fd);

    if (timed_out || read_error)
        {
            child::worker::kill_and_reap (child.pid);

            if (timed_out)
                throw resolution_error (RESOLUTION_TIMEOUT,
                                        "Timed out resolving " + query);

            throw resolution_error (RESOLUTION_EXTERNAL_TOOL_FAILURE,
                                    "Failed reading " + options.exe
                                        + " output");
        }

    const int exit_status = child::worker::call_waitpid (child.pid);

    std::vector<nlohmann::json> entries = parse_ytdlp_output (out);

    if (entries.empty ())
        {
            if (exit_status != 0)
                throw resolution_error (
                    RESOLUTION_EXTERNAL_TOOL_FAILURE,
                    options.exe + " exited with status "
                        + std::to_string (exit_status));

            throw resolution_error (RESOLUTION_NOT_FOUND,
                                    "No result for " + query);
        }

    size_t idx = options.ranking (entries);
    if (idx >= entries.size ())
        {
            fprintf (stderr,
                     "[YTDLPResolver::resolve WARN] Ranking returned "
                     "out of range index %ld, using first result\n",
                     idx);
            idx = 0;
        }

    return track_from_ytdlp_entry (entries.at (idx),
                                   util::get_current_ts ());
}

} // woot::player
