#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <geoserve/core/status.h>
#include <geoserve/server/config.h>
#include <geoserve/server/router.h>
#include <geoserve/util/logger.h>

namespace geoserve::server
{
    // Blocking HTTP/1.1 front end: one thread per connection, one request
    // per connection.
    class HttpServer
    {
    public:
        HttpServer(BindAddress bind, std::size_t max_connections, const Router *router, Logger *log = nullptr);
        ~HttpServer();

        HttpServer(const HttpServer &) = delete;
        HttpServer &operator=(const HttpServer &) = delete;

        // Binds and listens. Port 0 picks an ephemeral port, see port().
        Status Listen();
        // Accepts connections until Stop(); blocks the calling thread.
        void Run();
        void Stop();

        std::uint16_t port() const noexcept { return bound_port_; }

    private:
        struct Client
        {
            std::thread th;
            std::shared_ptr<std::atomic<bool>> done;
        };

        void AcceptLoop();
        void ClientSession(int fd);
        void ReapClients(bool all);

        BindAddress bind_;
        std::size_t max_connections_;
        const Router *router_;
        Logger *log_{nullptr};

        std::atomic<bool> running_{false};
        std::atomic<int> listen_fd_{-1};
        std::uint16_t bound_port_{0};

        std::atomic<std::int32_t> active_connections_{0};
        std::mutex client_mu_;
        std::vector<Client> clients_;
    };
} // namespace geoserve::server
