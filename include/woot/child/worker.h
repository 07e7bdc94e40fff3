#ifndef WOOT_CHILD_WORKER_H
#define WOOT_CHILD_WORKER_H

#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace woot::child::worker
{

struct child_process_t
{
    // -1 when spawn failed
    pid_t pid;
    // read end of child's stdout
    int read_fd;
};

/**
 * @brief Create a one way close-on-exec pipe, read_fd and write_fd
 */
std::pair<int, int> create_pipe ();

pid_t call_fork (const char *debug_child_name = NULL);

/**
 * @brief Block until child exits
 *
 * @return int Exit status, signal number if killed by signal, -2 on waitpid
 * error
 */
int call_waitpid (pid_t cpid);

/**
 * @brief SIGKILL child then reap it
 */
int kill_and_reap (pid_t cpid);

/**
 * @brief Fork and exec args[0] with stdout redirected into a pipe. Child
 * receives SIGKILL when this process dies.
 *
 * @param quiet Redirect child's stderr to /dev/null
 */
child_process_t spawn_reader (const std::vector<std::string> &args,
                              const bool quiet = true);

void close_valid_fd (int *fd);

} // woot::child::worker

#endif // WOOT_CHILD_WORKER_H
