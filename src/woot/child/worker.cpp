#include "woot/child/worker.h"
#include "woot/woot.h"
#include <fcntl.h>
#include <linux/prctl.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace woot::child::worker
{

std::pair<int, int>
create_pipe ()
{
    int fds[2];
    // other threads fork too, don't leak the write end into their children
    // or we'll never see EOF
    if (pipe2 (fds, O_CLOEXEC) == -1)
        {
            perror ("[child::worker::create_pipe ERROR] pipe2");

            return { -1, -1 };
        }

    return { fds[0], fds[1] };
}

pid_t
call_fork (const char *debug_child_name)
{
    pid_t pid = fork ();

    if (pid == -1)
        perror ("[child::worker::call_fork ERROR] fork");
    else if (debug_child_name && pid != 0 && get_debug_state ())
        fprintf (stderr, "[child::worker::call_fork] New child: %s (%d)\n",
                 debug_child_name, pid);

    return pid;
}

int
call_waitpid (pid_t cpid)
{
    int wstatus;
    int exitstatus = -1;
    pid_t w;

    do
        {
            w = waitpid (cpid, &wstatus, 0);
            if (w == -1)
                {
                    perror ("[child::worker::call_waitpid ERROR] waitpid");
                    return -2;
                }

            if (WIFEXITED (wstatus))
                {
                    exitstatus = WEXITSTATUS (wstatus);
                }
            else if (WIFSIGNALED (wstatus))
                {
                    exitstatus = WTERMSIG (wstatus);

                    if (get_debug_state ())
                        fprintf (stderr,
                                 "[child::worker::call_waitpid] %d: received "
                                 "signal %d\n",
                                 cpid, exitstatus);
                }
        }
    while (!WIFEXITED (wstatus) && !WIFSIGNALED (wstatus));

    return exitstatus;
}

int
kill_and_reap (pid_t cpid)
{
    if (cpid < 1)
        return -1;

    if (kill (cpid, SIGKILL) == -1)
        perror ("[child::worker::kill_and_reap ERROR] kill");

    return call_waitpid (cpid);
}

child_process_t
spawn_reader (const std::vector<std::string> &args, const bool quiet)
{
    if (args.empty ())
        return { -1, -1 };

    // prepare everything before fork, child may only call async-signal-safe
    // functions
    std::vector<char *> argv;
    argv.reserve (args.size () + 1);
    for (const std::string &a : args)
        argv.push_back (const_cast<char *> (a.c_str ()));
    argv.push_back (NULL);

    auto pipe_fds = create_pipe ();
    if (pipe_fds.first == -1)
        return { -1, -1 };

    const pid_t parent_pid = getpid ();
    pid_t pid = call_fork (argv[0]);

    if (pid == -1)
        {
            close (pipe_fds.first);
            close (pipe_fds.second);
            return { -1, -1 };
        }

    if (pid == 0)
        {
            if (prctl (PR_SET_PDEATHSIG, SIGKILL) == -1)
                _exit (EXIT_FAILURE);

            // parent died before prctl
            if (getppid () != parent_pid)
                _exit (EXIT_FAILURE);

            if (dup2 (pipe_fds.second, STDOUT_FILENO) == -1)
                _exit (EXIT_FAILURE);

            if (quiet)
                {
                    int null_fd = open ("/dev/null", O_WRONLY);
                    if (null_fd != -1)
                        dup2 (null_fd, STDERR_FILENO);
                }

            execvp (argv[0], argv.data ());

            _exit (127);
        }

    close (pipe_fds.second);

    return { pid, pipe_fds.first };
}

void
close_valid_fd (int *fd)
{
    if (*fd < 0)
        return;

    close (*fd);
    *fd = -1;
}

} // woot::child::worker
