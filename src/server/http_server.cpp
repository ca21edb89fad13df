#include <geoserve/server/http_server.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace geoserve::server
{
    static constexpr int kRecvTimeoutSec = 10;

    static bool WriteExact(int fd, const void *buf, std::size_t n)
    {
        const auto *p = reinterpret_cast<const std::uint8_t *>(buf);
        std::size_t sent = 0;
        while (sent < n)
        {
            ssize_t w = ::send(fd, p + sent, n - sent, MSG_NOSIGNAL);
            if (w <= 0)
            {
                if (w < 0 && errno == EINTR)
                    continue;
                return false;
            }
            sent += (std::size_t)w;
        }
        return true;
    }

    // Reads until the blank line that ends the request head. Returns false
    // on EOF, error, timeout, or a head larger than kMaxRequestHead.
    static bool ReadRequestHead(int fd, std::string &head)
    {
        char buf[2048];
        while (head.find("\r\n\r\n") == std::string::npos)
        {
            if (head.size() > kMaxRequestHead)
                return false;
            ssize_t r = ::recv(fd, buf, sizeof(buf), 0);
            if (r == 0)
                return false;
            if (r < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            head.append(buf, (std::size_t)r);
        }
        head.resize(head.find("\r\n\r\n") + 4);
        return true;
    }

    HttpServer::HttpServer(BindAddress bind, std::size_t max_connections, const Router *router, Logger *log)
        : bind_(std::move(bind)), max_connections_(max_connections), router_(router), log_(log)
    {
    }

    HttpServer::~HttpServer() { Stop(); }

    Status HttpServer::Listen()
    {
        sockaddr_storage ss{};
        socklen_t ss_len = 0;
        int family = AF_INET;

        auto *v4 = reinterpret_cast<sockaddr_in *>(&ss);
        auto *v6 = reinterpret_cast<sockaddr_in6 *>(&ss);
        if (inet_pton(AF_INET, bind_.host.c_str(), &v4->sin_addr) == 1)
        {
            v4->sin_family = AF_INET;
            v4->sin_port = htons(bind_.port);
            ss_len = sizeof(sockaddr_in);
        }
        else if (inet_pton(AF_INET6, bind_.host.c_str(), &v6->sin6_addr) == 1)
        {
            family = AF_INET6;
            v6->sin6_family = AF_INET6;
            v6->sin6_port = htons(bind_.port);
            ss_len = sizeof(sockaddr_in6);
        }
        else
        {
            return Status::Invalid("bind host is not an IP literal: " + bind_.host);
        }

        const int fd = ::socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0)
            return Status::FromErrno(GeoErrc::IoError, "socket");

        int yes = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        if (::bind(fd, reinterpret_cast<sockaddr *>(&ss), ss_len) != 0)
        {
            Status st = Status::FromErrno(GeoErrc::IoError, "bind " + bind_.host + ":" + std::to_string(bind_.port));
            ::close(fd);
            return st;
        }
        if (::listen(fd, 128) != 0)
        {
            Status st = Status::FromErrno(GeoErrc::IoError, "listen");
            ::close(fd);
            return st;
        }

        sockaddr_storage actual{};
        socklen_t actual_len = sizeof(actual);
        if (::getsockname(fd, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0)
        {
            bound_port_ = (family == AF_INET) ? ntohs(reinterpret_cast<sockaddr_in *>(&actual)->sin_port)
                                              : ntohs(reinterpret_cast<sockaddr_in6 *>(&actual)->sin6_port);
        }

        listen_fd_.store(fd);
        running_.store(true);
        if (log_)
            log_->Info("server.listen", "HTTP listening on " + bind_.host + ":" + std::to_string(bound_port_));
        return Status::Ok();
    }

    void HttpServer::Run()
    {
        AcceptLoop();
        ReapClients(true);
    }

    void HttpServer::Stop()
    {
        if (!running_.exchange(false))
            return;

        const int fd = listen_fd_.exchange(-1);
        if (fd >= 0)
        {
            ::shutdown(fd, SHUT_RDWR);
            ::close(fd);
        }
        if (log_)
            log_->Info("server.stop", "HTTP listener closed");
    }

    void HttpServer::ReapClients(bool all)
    {
        std::vector<Client> finished;
        {
            std::lock_guard<std::mutex> lk(client_mu_);
            auto it = clients_.begin();
            while (it != clients_.end())
            {
                if (all || it->done->load(std::memory_order_acquire))
                {
                    finished.push_back(std::move(*it));
                    it = clients_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }
        for (auto &c : finished)
        {
            if (c.th.joinable())
                c.th.join();
        }
    }

    void HttpServer::AcceptLoop()
    {
        while (running_)
        {
            const int fd = listen_fd_.load();
            if (fd < 0)
                break;
            int client_fd = ::accept4(fd, nullptr, nullptr, SOCK_CLOEXEC);

            if (client_fd < 0)
            {
                if (errno == EINTR)
                    continue;
                if (!running_)
                    break;

                if (log_)
                    log_->Error("server.accept", "accept failed: " + std::string(std::strerror(errno)));
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }

            ReapClients(false);

            if (active_connections_ >= static_cast<std::int32_t>(max_connections_))
            {
                if (log_)
                    log_->Warn("server.accept", "max connections reached, rejecting client");
                ::close(client_fd);
                continue;
            }

            int yes = 1;
            ::setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
            timeval tv{};
            tv.tv_sec = kRecvTimeoutSec;
            ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            active_connections_++;
            auto done = std::make_shared<std::atomic<bool>>(false);
            std::thread t([this, client_fd, done]()
                          {
                this->ClientSession(client_fd);
                done->store(true, std::memory_order_release); });
            {
                std::lock_guard<std::mutex> lk(client_mu_);
                clients_.push_back(Client{std::move(t), std::move(done)});
            }
        }
    }

    void HttpServer::ClientSession(int fd)
    {
        struct Guard
        {
            HttpServer *s;
            int fd;
            ~Guard()
            {
                ::close(fd);
                s->active_connections_--;
            }
        } guard{this, fd};

        std::string head;
        HttpResponse resp;
        if (!ReadRequestHead(fd, head))
        {
            if (head.empty())
                return;
            resp.status = head.size() > kMaxRequestHead ? 431 : 400;
            resp.body = "{\"error\":\"bad request\"}";
        }
        else
        {
            auto req = ParseHttpRequest(head);
            if (!req.ok())
            {
                resp.status = 400;
                resp.body = "{\"error\":\"bad request\"}";
            }
            else
            {
                resp = router_->Handle(req.value());
                if (log_)
                    log_->Debug("http.request", req.value().method + " " + req.value().target + " -> " +
                                                    std::to_string(resp.status));
            }
        }

        const std::string wire = SerializeResponse(resp);
        if (!WriteExact(fd, wire.data(), wire.size()) && log_)
            log_->Debug("http.write", "client went away before the response was sent");
    }
} // namespace geoserve::server
