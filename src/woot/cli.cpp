#include "woot/slash.h"
#include "woot/util.h"
#include "woot/woot.h"
#include <regex>
#include <sstream>

void
print_usage_register_slash ()
{
    fprintf (stderr,
             "Usage:\n\treg <guild_id|\"g\">\n\trm-reg <guild_id|\"g\">\n");
}

namespace woot
{

void
command_create_callback (const dpp::confirmation_callback_t &e)
{
    if (e.is_error ())
        util::log_confirmation_error (e, "cli");
    else
        fprintf (stderr, "[INFO] Done\n");

    set_running_state (false);
}

int
_reg (dpp::cluster &client, dpp::snowflake bot_id, int argc,
      const char *argv[], bool rm = false)
{
    if (argc == 2)
        {
            fprintf (stderr,
                     "Provide guild_id or \"g\" to register globally\n");
            set_running_state (false);
            return 0;
        }

    std::string a2 = std::string (argv[2]);

    // deleting doesn't need a ready client but the request needs app id
    client.me.id = bot_id;

    if (a2 == "g")
        {
            fprintf (stderr, "%s commands globally...\n",
                     rm ? "Deleting" : "Registering");

            client.global_bulk_command_create (
                rm ? std::vector<dpp::slashcommand> ()
                   : command::get_all (bot_id),
                command_create_callback);
            return 0;
        }

    if (!std::regex_match (argv[2], std::regex ("^\\d{17,20}$"),
                           std::regex_constants::match_any))
        {
            fprintf (stderr, "Provide valid guild_id\n");
            set_running_state (false);
            return 0;
        }

    uint64_t gid = 0;
    std::istringstream iss (a2);
    iss >> gid;

    if (iss.fail ())
        {
            fprintf (stderr, "Invalid integer, too large\n");
            set_running_state (false);
            return 0;
        }

    fprintf (stderr, "%s commands in %lu\n", rm ? "Deleting" : "Registering",
             (unsigned long)gid);

    client.guild_bulk_command_create (
        rm ? std::vector<dpp::slashcommand> () : command::get_all (bot_id),
        gid, command_create_callback);
    return 0;
}

int
cli (dpp::cluster &client, dpp::snowflake bot_id, int argc, const char *argv[])
{
    std::string a1 = std::string (argv[1]);

    int cmd = -1;
    if (a1 == "reg")
        cmd = 0;
    if (a1 == "rm-reg")
        cmd = 1;

    if (cmd < 0)
        {
            print_usage_register_slash ();
            set_running_state (false);
            return 1;
        }

    return _reg (client, bot_id, argc, argv, cmd == 1);
}
} // namespace woot
