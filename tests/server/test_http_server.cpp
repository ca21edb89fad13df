#include <catch2/catch.hpp>

#include <geoserve/server/http_server.h>

#include "common/mmdb_writer.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace geoserve;
using namespace geoserve::server;
using namespace geoserve::test;

namespace
{
    // Sends `raw` to 127.0.0.1:port and reads until the server closes.
    // Returns an empty string if the exchange fails. No assertions here: it
    // runs on client threads.
    std::string Exchange(std::uint16_t port, const std::string &raw)
    {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
            return {};
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0)
        {
            ::close(fd);
            return {};
        }

        std::size_t sent = 0;
        while (sent < raw.size())
        {
            ssize_t w = ::send(fd, raw.data() + sent, raw.size() - sent, MSG_NOSIGNAL);
            if (w <= 0)
            {
                ::close(fd);
                return {};
            }
            sent += static_cast<std::size_t>(w);
        }

        std::string reply;
        char buf[4096];
        for (;;)
        {
            ssize_t r = ::recv(fd, buf, sizeof(buf), 0);
            if (r <= 0)
                break;
            reply.append(buf, static_cast<std::size_t>(r));
        }
        ::close(fd);
        return reply;
    }

    struct Running
    {
        db::ActiveSlot slot;
        service::LookupService lookup{&slot, "en"};
        Router router{&lookup, AccessPolicy{{"localhost", "127.0.0.1"}, ""}};
        HttpServer server{BindAddress{"127.0.0.1", 0}, 8, &router};
        std::thread th;

        Running()
        {
            auto gen = db::Generation::FromBuffer(BuildCityFixture());
            REQUIRE(gen.ok());
            slot.Swap(gen.move_value());
            REQUIRE(server.Listen().ok());
            REQUIRE(server.port() != 0);
            th = std::thread([this]
                             { server.Run(); });
        }

        ~Running()
        {
            server.Stop();
            if (th.joinable())
                th.join();
        }
    };
}

TEST_CASE("The server answers health checks over loopback", "[server][http_server]")
{
    Running r;
    const std::string reply = Exchange(r.server.port(), "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");
    REQUIRE(reply.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(reply.find("Connection: close") != std::string::npos);
    REQUIRE(reply.substr(reply.find("\r\n\r\n") + 4) == "{\"status\":\"healthy\"}");
}

TEST_CASE("The server routes lookups through the router", "[server][http_server]")
{
    Running r;

    std::string reply = Exchange(r.server.port(), "GET /81.2.69.160 HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n");
    REQUIRE(reply.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(reply.find("\"city\":\"London\"") != std::string::npos);

    reply = Exchange(r.server.port(), "GET /81.2.69.160 HTTP/1.1\r\nHost: elsewhere\r\n\r\n");
    REQUIRE(reply.rfind("HTTP/1.1 403 Forbidden\r\n", 0) == 0);

    reply = Exchange(r.server.port(), "GET /10.0.0.1 HTTP/1.1\r\nHost: localhost\r\n\r\n");
    REQUIRE(reply.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
}

TEST_CASE("Garbage requests get 400", "[server][http_server]")
{
    Running r;
    const std::string reply = Exchange(r.server.port(), "HELLO\r\n\r\n");
    REQUIRE(reply.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);
}

TEST_CASE("Parallel clients are all served", "[server][http_server]")
{
    Running r;
    std::vector<std::thread> clients;
    std::atomic<int> ok{0};
    for (int i = 0; i < 6; ++i)
    {
        clients.emplace_back([&]
                             {
            const std::string reply = Exchange(r.server.port(), "GET /8.8.8.8 HTTP/1.1\r\nHost: localhost\r\n\r\n");
            if (reply.find("Mountain View") != std::string::npos)
                ok.fetch_add(1); });
    }
    for (auto &t : clients)
        t.join();
    REQUIRE(ok.load() == 6);
}

TEST_CASE("Stop races cleanly with a freshly started accept loop", "[server][http_server]")
{
    for (int i = 0; i < 20; ++i)
    {
        Running r;
        std::thread a([&]
                      { r.server.Stop(); });
        std::thread b([&]
                      { r.server.Stop(); });
        a.join();
        b.join();
        r.th.join();
    }

    // Once stopped the port no longer accepts connections.
    Running r;
    r.server.Stop();
    r.th.join();
    REQUIRE(Exchange(r.server.port(), "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n").empty());
}
