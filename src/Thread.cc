#include "Thread.hh"

#include <csignal>
#include <pthread.h>

namespace Clue {

Thread::Thread() noexcept = default;

Thread::Thread(Thread&& other) noexcept = default;

Thread::~Thread()
{
    if (thread.joinable()) {
        thread.join();
    }
}

Thread& Thread::operator=(Thread&& other) noexcept = default;

void Thread::blockTerminationSignals()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

}
