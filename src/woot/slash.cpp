#include "woot/slash.h"
#include "woot/cmds.h"
#include "woot/cmds/jump.h"
#include "woot/cmds/loop.h"
#include "woot/cmds/nowplaying.h"
#include "woot/cmds/pause.h"
#include "woot/cmds/play.h"
#include "woot/cmds/queue.h"
#include "woot/cmds/remove.h"
#include "woot/cmds/resume.h"
#include "woot/cmds/shuffle.h"
#include "woot/cmds/skip.h"
#include "woot/cmds/stop.h"
#include "woot/cmds/volume.h"

namespace woot::command
{
inline constexpr const command_handlers_map_t command_handlers
    = { { "play", play::slash_run },
        { "pause", pause::slash_run },
        { "resume", resume::slash_run },
        { "skip", skip::slash_run },
        { "stop", stop::slash_run },
        { "leave", stop::slash_run },
        { "loop", loop::slash_run },
        { "volume", volume::slash_run },
        { "queue", queue::slash_run },
        { "jump", jump::slash_run },
        { "remove", remove::slash_run },
        { "shuffle", shuffle::slash_run },
        { "nowplaying", nowplaying::slash_run },
        { NULL, NULL } };

std::vector<dpp::slashcommand>
get_all (const dpp::snowflake &bot_id)
{
    std::vector<dpp::slashcommand> slash_commands ({
        play::get_register_obj (bot_id),
        pause::get_register_obj (bot_id),
        resume::get_register_obj (bot_id),
        skip::get_register_obj (bot_id),
        stop::get_register_obj (bot_id),
        stop::get_leave_register_obj (bot_id),
        loop::get_register_obj (bot_id),
        volume::get_register_obj (bot_id),
        queue::get_register_obj (bot_id),
        jump::get_register_obj (bot_id),
        remove::get_register_obj (bot_id),
        shuffle::get_register_obj (bot_id),
        nowplaying::get_register_obj (bot_id),
    });
    return slash_commands;
}

const command_handler_t *
get_slash_command_handlers ()
{
    return command_handlers;
}
} // woot::command
