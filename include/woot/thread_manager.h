#ifndef WOOT_THREAD_MANAGER_H
#define WOOT_THREAD_MANAGER_H

#include <deque>
#include <thread>

namespace woot
{
namespace thread_manager
{

struct thread_data
{
    std::thread t;
    bool done;
};

void print_total_thread ();

/**
 * @brief Take ownership of t, it will be joined by join_done after it marked
 * itself done or by join_all
 */
void dispatch (std::thread &t);

void set_done ();

void join_done ();

void join_all ();

size_t get_total_thread ();

// marks the current thread done when it goes out of scope
struct DoneSetter
{
    ~DoneSetter () { set_done (); }
};

} // thread_manager
} // woot

#endif // WOOT_THREAD_MANAGER_H
