#include "woot/thread_manager.h"
#include "woot/woot.h"

#include <algorithm>
#include <deque>
#include <iostream>
#include <mutex>
#include <stdio.h>
#include <thread>
#include <vector>

namespace woot
{
namespace thread_manager
{
std::mutex _ns_mutex;
std::deque<thread_data> _threads = {};

// threads finished before dispatch got to register them
std::vector<std::thread::id> _early_done = {};

void
print_total_thread ()
{
    fprintf (stderr, "[INFO] Total active thread: %ld\n", _threads.size ());
}

size_t
get_total_thread ()
{
    std::lock_guard lk (_ns_mutex);
    return _threads.size ();
}

void
dispatch (std::thread &t)
{
    if (!get_running_state ())
        {
            std::cerr << "[thread_manager::dispatch WARN] Not running, "
                         "detaching thread "
                      << t.get_id () << '\n';

            t.detach ();

            return;
        }

    const bool debug = get_debug_state ();
    std::lock_guard lk (_ns_mutex);

    if (debug)
        {
            std::cerr << "[INFO] New thread spawned: " << t.get_id () << "\n";
        }

    bool done = false;
    auto e = std::find (_early_done.begin (), _early_done.end (), t.get_id ());
    if (e != _early_done.end ())
        {
            _early_done.erase (e);
            done = true;
        }

    _threads.push_back ({ std::move (t), done });

    if (debug)
        {
            print_total_thread ();
        }
}

void
set_done ()
{
    std::lock_guard lk (_ns_mutex);

    const auto id = std::this_thread::get_id ();

    auto i = std::find_if (_threads.begin (), _threads.end (),
                           [&id] (const thread_data &td) {
                               return td.t.get_id () == id;
                           });

    if (i != _threads.end ())
        i->done = true;
    else
        _early_done.push_back (id);

    if (get_debug_state ())
        {
            std::cerr << "[INFO] Thread done: " << id << "\n";
            print_total_thread ();
        }
}

void
join_done ()
{
    std::deque<thread_data> done_threads;

    {
        std::lock_guard lk (_ns_mutex);

        auto i = _threads.begin ();
        while (i != _threads.end ())
            {
                if (!i->done)
                    {
                        i++;
                        continue;
                    }

                done_threads.push_back (std::move (*i));
                i = _threads.erase (i);
            }
    }

    // a done thread can still be destroying its captures, join outside the
    // lock so it's free to dispatch or set_done
    size_t joined = 0;
    for (auto &td : done_threads)
        {
            if (td.t.joinable ())
                {
                    td.t.join ();
                    joined++;
                }
        }

    if (joined && get_debug_state ())
        {
            fprintf (stderr, "[INFO] Total thread done and joined: %ld\n",
                     joined);
        }
}

void
join_all ()
{
    const bool debug = get_debug_state ();

    if (debug)
        {
            std::lock_guard lk (_ns_mutex);
            fprintf (stderr, "[INFO] Joining %ld threads...\n",
                     _threads.size ());
        }

    size_t joined = 0;
    while (true)
        {
            thread_data td;

            {
                std::lock_guard lk (_ns_mutex);
                if (_threads.empty ())
                    break;

                td = std::move (_threads.front ());
                _threads.pop_front ();
            }

            // joined thread may dispatch another one on its way out,
            // it will be picked up by the next iteration
            if (td.t.joinable ())
                {
                    td.t.join ();
                    joined++;
                }
        }

    {
        std::lock_guard lk (_ns_mutex);
        _early_done.clear ();
    }

    if (debug)
        {
            fprintf (stderr, "[INFO] Total joined thread: %ld\n", joined);
        }
}

} // thread_manager
} // woot
