#include <catch2/catch.hpp>

#include "woot/resolver.h"
#include "woot/util.h"
#include <fstream>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace woot;
using namespace woot::player;

namespace
{

/**
 * @brief Write an executable shell script standing in for yt-dlp
 */
std::string
write_script (const std::string &name, const std::string &body)
{
    static std::string dir;

    if (dir.empty ())
        {
            char tmpl[] = "/tmp/woot_tests_XXXXXX";
            const char *d = mkdtemp (tmpl);
            REQUIRE (d != NULL);
            dir = d;
        }

    const std::string path = dir + "/" + name;

    {
        std::ofstream f (path, std::ios::trunc);
        f << "#!/bin/sh\n" << body << "\n";
    }

    REQUIRE (chmod (path.c_str (), 0755) == 0);

    return path;
}

YTDLPResolver
make_resolver (const std::string &exe, const long long timeout_ms = 5000)
{
    ytdlp_options_t o;
    o.exe = exe;
    o.timeout_ms = timeout_ms;
    o.search_candidates = 1;
    o.ranking = first_result;

    return YTDLPResolver (o);
}

resolution_error_kind_t
resolve_error_kind (YTDLPResolver &resolver, const std::string &query)
{
    try
        {
            resolver.resolve (query);
        }
    catch (const resolution_error &e)
        {
            return e.kind ();
        }

    FAIL ("resolve didn't throw");
    return RESOLUTION_NOT_FOUND;
}

} // namespace

TEST_CASE ("Url detection", "[resolver]")
{
    CHECK (is_url ("https://www.youtube.com/watch?v=dQw4w9WgXcQ"));
    CHECK (is_url ("HTTP://example.com/a.mp3"));
    CHECK_FALSE (is_url ("never gonna give you up"));
    CHECK_FALSE (is_url ("https://"));
    CHECK_FALSE (is_url ("ftp://example.com/a.mp3"));
    CHECK_FALSE (is_url ("https://example.com/a b"));
}

TEST_CASE ("yt-dlp target", "[resolver]")
{
    CHECK (get_ytdlp_target ("lofi beats", 1) == "ytsearch1:lofi beats");
    CHECK (get_ytdlp_target ("lofi beats", 3) == "ytsearch3:lofi beats");
    CHECK (get_ytdlp_target ("lofi beats", 0) == "ytsearch1:lofi beats");
    CHECK (get_ytdlp_target ("https://youtu.be/abc", 3)
           == "https://youtu.be/abc");
}

TEST_CASE ("Default ranking picks the first candidate", "[resolver]")
{
    std::vector<nlohmann::json> candidates
        = { { { "title", "a" } }, { { "title", "b" } } };

    CHECK (first_result (candidates) == 0);
    CHECK (first_result ({ { { "title", "only" } } }) == 0);
    CHECK (get_ytdlp_options ().ranking (candidates) == 0);
}

TEST_CASE ("Parse yt-dlp output", "[resolver]")
{
    SECTION ("one document per line, blank lines skipped")
    {
        auto entries = parse_ytdlp_output (
            "{\"title\":\"a\"}\n\n{\"title\":\"b\"}\r\n  \n");

        REQUIRE (entries.size () == 2);
        CHECK (entries.at (0)["title"] == "a");
        CHECK (entries.at (1)["title"] == "b");
    }

    SECTION ("empty output")
    {
        CHECK (parse_ytdlp_output ("").empty ());
    }

    SECTION ("malformed line")
    {
        try
            {
                parse_ytdlp_output ("{\"title\":\"a\"}\nERROR: oops\n");
                FAIL ("didn't throw");
            }
        catch (const resolution_error &e)
            {
                CHECK (e.kind () == RESOLUTION_EXTERNAL_TOOL_FAILURE);
            }
    }
}

TEST_CASE ("Track from yt-dlp entry", "[resolver]")
{
    SECTION ("complete entry")
    {
        auto entry = nlohmann::json::parse (R"({
            "title": "Song",
            "duration": 212.5,
            "url": "https://cdn.example.com/audio",
            "webpage_url": "https://example.com/watch?v=1",
            "thumbnail": "https://example.com/1.jpg"
        })");

        track_t t = track_from_ytdlp_entry (entry, 77);

        CHECK (t.title == "Song");
        CHECK (t.duration == 212500);
        REQUIRE (t.is_resolved ());
        CHECK (t.stream->url == "https://cdn.example.com/audio");
        CHECK (t.stream->webpage_url == "https://example.com/watch?v=1");
        CHECK (t.stream->thumbnail == "https://example.com/1.jpg");
        CHECK (t.stream->resolved_at == 77);
    }

    SECTION ("live stream without title or duration")
    {
        auto entry = nlohmann::json::parse (
            R"({"url": "https://cdn.example.com/live", "duration": null})");

        track_t t = track_from_ytdlp_entry (entry, 0);

        CHECK (t.title == "Unknown Title");
        CHECK (t.duration == 0);
    }

    SECTION ("missing url")
    {
        auto entry = nlohmann::json::parse (R"({"title": "Song"})");

        CHECK_THROWS_AS (track_from_ytdlp_entry (entry, 0), resolution_error);
    }
}

TEST_CASE ("Track identity survives resolution", "[resolver][track]")
{
    track_t request = create_track ("some song", 42);
    track_t other = create_track ("some song", 42);

    CHECK (request.id != other.id);
    CHECK (request.title == "some song");
    CHECK_FALSE (request.is_resolved ());

    auto entry = nlohmann::json::parse (
        R"({"title": "Some Song", "url": "https://cdn.example.com/a"})");

    track_t merged
        = merge_resolution (request, track_from_ytdlp_entry (entry, 0));

    CHECK (merged.id == request.id);
    CHECK (merged.query == "some song");
    CHECK (merged.requested_by == 42);
    CHECK (merged.title == "Some Song");
    CHECK (merged.is_resolved ());
}

TEST_CASE ("Stream validity", "[resolver][track]")
{
    stream_source_t s = {};
    s.url = "https://cdn.example.com/a";
    s.resolved_at = util::get_current_ts ();

    CHECK (s.is_valid (s.resolved_at, 1000));
    CHECK_FALSE (s.is_valid (s.resolved_at + util::ms_to_ns (2000), 1000));
    CHECK (s.is_valid (s.resolved_at + util::ms_to_ns (2000), 0));

    s.url.clear ();
    CHECK_FALSE (s.is_valid (s.resolved_at, 0));
}

TEST_CASE ("Resolve with yt-dlp", "[resolver][process]")
{
    SECTION ("first result is picked")
    {
        auto resolver = make_resolver (write_script (
            "ok.sh",
            "echo '{\"title\":\"First\",\"duration\":60,\"url\":\"https://"
            "cdn.example.com/1\"}'\n"
            "echo '{\"title\":\"Second\",\"duration\":30,\"url\":\"https://"
            "cdn.example.com/2\"}'"));

        track_t t = resolver.resolve ("anything");

        CHECK (t.title == "First");
        CHECK (t.duration == 60000);
        REQUIRE (t.is_resolved ());
        CHECK (t.stream->url == "https://cdn.example.com/1");
    }

    SECTION ("custom ranking")
    {
        ytdlp_options_t o;
        o.exe = write_script (
            "rank.sh",
            "echo '{\"title\":\"First\",\"url\":\"https://cdn.example.com/1\"}'\n"
            "echo '{\"title\":\"Second\",\"url\":\"https://cdn.example.com/2\"}'");
        o.timeout_ms = 5000;
        o.search_candidates = 2;
        o.ranking = [] (const std::vector<nlohmann::json> &c) {
            return c.size () - 1;
        };

        YTDLPResolver resolver (o);
        CHECK (resolver.resolve ("anything").title == "Second");
    }

    SECTION ("query reaches yt-dlp as last argument")
    {
        auto resolver = make_resolver (write_script (
            "echo_arg.sh",
            "for a; do last=\"$a\"; done\n"
            "printf '{\"title\":\"%s\",\"url\":\"https://cdn.example.com/1\"}\\n'"
            " \"$last\""));

        CHECK (resolver.resolve ("my song").title == "ytsearch1:my song");
        CHECK (resolver.resolve ("https://example.com/a").title
               == "https://example.com/a");
    }

    SECTION ("no result")
    {
        auto resolver = make_resolver (write_script ("empty.sh", "exit 0"));
        CHECK (resolve_error_kind (resolver, "x") == RESOLUTION_NOT_FOUND);
    }

    SECTION ("tool failure")
    {
        auto resolver = make_resolver (
            write_script ("fail.sh", "echo 'ERROR: nope' >&2\nexit 3"));
        CHECK (resolve_error_kind (resolver, "x")
               == RESOLUTION_EXTERNAL_TOOL_FAILURE);
    }

    SECTION ("malformed output")
    {
        auto resolver
            = make_resolver (write_script ("garbage.sh", "echo 'not json'"));
        CHECK (resolve_error_kind (resolver, "x")
               == RESOLUTION_EXTERNAL_TOOL_FAILURE);
    }

    SECTION ("entry without stream url")
    {
        auto resolver = make_resolver (
            write_script ("nourl.sh", "echo '{\"title\":\"Song\"}'"));
        CHECK (resolve_error_kind (resolver, "x")
               == RESOLUTION_EXTERNAL_TOOL_FAILURE);
    }

    SECTION ("missing executable")
    {
        auto resolver = make_resolver ("/nonexistent/woot-yt-dlp");
        CHECK (resolve_error_kind (resolver, "x")
               == RESOLUTION_EXTERNAL_TOOL_FAILURE);
    }

    SECTION ("timeout")
    {
        auto resolver
            = make_resolver (write_script ("slow.sh", "exec sleep 5"), 300);

        const long long start = util::get_current_ts ();
        CHECK (resolve_error_kind (resolver, "x") == RESOLUTION_TIMEOUT);
        CHECK (util::ns_to_ms (util::get_current_ts () - start) < 3000);
    }
}
