//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: apps/tvkit_serve.cpp
// Purpose: Serve the demo application to raw-mode TCP clients on
//          127.0.0.1:<port>, one ChannelBackend session per connection.
// Key invariants: Each connection has its own application, command registry
//                 and worker thread; sessions share nothing.
// Ownership/Lifetime: A session thread owns its socket and closes it when the
//                     application exits or the peer disconnects.
// Links: include/tvkit/term/stream_session.hpp, apps/demo_app.hpp
//
//===----------------------------------------------------------------------===//

#include "demo_app.hpp"

#include "tvkit/support/log.hpp"
#include "tvkit/term/stream_session.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace tvkit;

namespace
{
constexpr int kDefaultPort = 7000;

void serveClient(int fd, const config::Config &cfg)
{
    auto session = term::ChannelSessionBuilder()
                       .size(80, 24)
                       .doubleClickWindow(std::chrono::milliseconds(cfg.input.doubleClickMs))
                       .build();
    term::StreamSession::Options opts;
    opts.escapeDelay = std::chrono::milliseconds(cfg.input.escapeDelayMs);
    term::StreamSession pump(std::move(session.handle), fd, fd, opts);
    pump.start();
    {
        demo::DemoApp app(std::move(session.backend), cfg);
        if (auto st = app.init(); !st.isOk())
        {
            support::logError("session init failed: " + st.error().toString());
        }
        else
        {
            app.buildUi();
            auto runStatus = app.run();
            if (!runStatus.isOk())
                support::logInfo("session ended: " + runStatus.error().toString());
            else
                support::logInfo("session ended by quit");
        }
    }
    pump.stop();
    ::close(fd);
}

int listenOn(int port)
{
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
    {
        return -1;
    }
    int one = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0)
    {
        ::close(fd);
        return -1;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0 || ::listen(fd, 8) < 0)
    {
        ::close(fd);
        return -1;
    }
    return fd;
}
} // namespace

int main(int argc, char **argv)
{
    int port = kDefaultPort;
    if (argc > 1)
    {
        port = std::atoi(argv[1]);
        if (port <= 0 || port > 65535)
        {
            std::cerr << "usage: tvkit_serve [port]\n";
            return 2;
        }
    }

    config::Config cfg;
    if (const char *path = std::getenv("TVKIT_CONFIG"))
    {
        auto st = config::loadFromFile(path, cfg);
        if (!st.isOk())
        {
            std::cerr << "tvkit_serve: " << st.error().toString() << '\n';
            return 2;
        }
    }
    if (auto st = config::applyLogConfig(cfg.log); !st.isOk())
    {
        std::cerr << "tvkit_serve: " << st.error().toString() << '\n';
    }

    std::signal(SIGPIPE, SIG_IGN);

    const int listener = listenOn(port);
    if (listener < 0)
    {
        std::cerr << "tvkit_serve: " << support::errnoError(support::Errc::Io, "listen").toString() << '\n';
        return 1;
    }
    support::logInfo("listening on 127.0.0.1:" + std::to_string(port));

    while (true)
    {
        const int client = ::accept(listener, nullptr, nullptr);
        if (client < 0)
        {
            if (errno == EINTR)
                continue;
            support::logError(support::errnoError(support::Errc::Io, "accept").toString());
            break;
        }
        support::logInfo("client connected on fd " + std::to_string(client));
        std::thread(serveClient, client, cfg).detach();
    }
    ::close(listener);
    return 1;
}
