#include "messaging/MessageLoop.hh"

#include "Logging.hh"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace Clue {
namespace Messaging {

namespace {

sigset_t createTerminationSigmask()
{
    auto mask = sigset_t {};
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    return mask;
}

[[noreturn]] void throwSystemError(const char* what)
{
    throw std::system_error {errno, std::generic_category(), what};
}

class SignalFd {
public:
    SignalFd();
    ~SignalFd();
    int get() const { return fd; }
    int readSignal();
private:
    int fd;
};

SignalFd::SignalFd()
{
    const auto mask = createTerminationSigmask();
    fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd == -1) {
        throwSystemError("signalfd");
    }
}

SignalFd::~SignalFd()
{
    if (close(fd) != 0) {
        log(LogLevel::ERROR, "Failed to close signalfd: %s",
            std::strerror(errno));
    }
}

int SignalFd::readSignal()
{
    auto info = signalfd_siginfo {};
    if (read(fd, &info, sizeof(info)) != sizeof(info)) {
        throwSystemError("read signalfd");
    }
    return static_cast<int>(info.ssi_signo);
}

}

class MessageLoop::Impl {
public:
    Impl();
    ~Impl();
    void addPollable(PollableSocket socket, SocketCallback callback);
    void removePollable(Socket& socket);
    void run();
    void terminate();
private:
    using SocketCallbackPair = std::pair<PollableSocket, SocketCallback>;
    auto findPollable(void* handle);
    std::vector<SocketCallbackPair> callbacks;
    sigset_t oldMask;
    bool running {};
};

MessageLoop::Impl::Impl()
{
    const auto mask = createTerminationSigmask();
    if (const auto err = pthread_sigmask(SIG_BLOCK, &mask, &oldMask)) {
        throw std::system_error {err, std::generic_category(), "sigmask"};
    }
}

MessageLoop::Impl::~Impl()
{
    if (const auto err = pthread_sigmask(SIG_SETMASK, &oldMask, nullptr)) {
        log(LogLevel::ERROR, "Failed to restore signal mask: %s",
            std::strerror(err));
    }
}

auto MessageLoop::Impl::findPollable(void* handle)
{
    return std::find_if(
        callbacks.begin(), callbacks.end(),
        [handle](const auto& callback)
        {
            return callback.first->handle() == handle;
        });
}

void MessageLoop::Impl::addPollable(
    PollableSocket socket, SocketCallback callback)
{
    if (findPollable(socket->handle()) != callbacks.end()) {
        throw std::invalid_argument {"Socket already registered"};
    }
    callbacks.emplace_back(std::move(socket), std::move(callback));
}

void MessageLoop::Impl::removePollable(Socket& socket)
{
    const auto iter = findPollable(socket.handle());
    if (iter != callbacks.end()) {
        callbacks.erase(iter);
    }
}

void MessageLoop::Impl::run()
{
    auto signal_fd = SignalFd {};
    auto pollitems = std::vector<Pollitem> {};
    running = true;
    while (running) {
        // the first item is the signal descriptor, followed by the sockets
        pollitems.clear();
        pollitems.push_back({ nullptr, signal_fd.get(), ZMQ_POLLIN, 0 });
        for (const auto& [socket, callback] : callbacks) {
            pollitems.push_back({ socket->handle(), 0, ZMQ_POLLIN, 0 });
        }
        try {
            pollSockets(pollitems);
        } catch (const SocketError& e) {
            if (e.num() == EINTR) {
                continue;
            }
            throw;
        }
        if (pollitems.front().revents & ZMQ_POLLIN) {
            const auto signo = signal_fd.readSignal();
            log(LogLevel::INFO, "Terminating on signal: %s",
                strsignal(signo));
            break;
        }
        // callbacks may register and deregister sockets
        auto ready = std::vector<SocketCallbackPair> {};
        for (auto i = 1u; i < pollitems.size(); ++i) {
            if (pollitems[i].revents & ZMQ_POLLIN) {
                ready.push_back(callbacks[i - 1]);
            }
        }
        for (auto& [socket, callback] : ready) {
            try {
                callback(*socket);
            } catch (const std::exception& e) {
                log(LogLevel::ERROR, "Exception caught in message loop: %s",
                    e.what());
            }
            if (!running) {
                break;
            }
        }
    }
}

void MessageLoop::Impl::terminate()
{
    running = false;
}

MessageLoop::MessageLoop() :
    impl {std::make_unique<Impl>()}
{
}

MessageLoop::~MessageLoop() = default;

void MessageLoop::addPollable(PollableSocket socket, SocketCallback callback)
{
    if (!socket) {
        throw std::invalid_argument {"Pollable socket is empty"};
    }
    if (!callback) {
        throw std::invalid_argument {"Socket callback is empty"};
    }
    impl->addPollable(std::move(socket), std::move(callback));
}

void MessageLoop::removePollable(Socket& socket)
{
    impl->removePollable(socket);
}

void MessageLoop::run()
{
    impl->run();
}

void MessageLoop::terminate()
{
    impl->terminate();
}

}
}
