#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace tollgate {
namespace test_support {

struct ReceivedRequest {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers;  // names lower-cased
    std::string body;

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }
};

// HTTP/1.1 server on 127.0.0.1 with keep-alive. The handler returns the raw
// response bytes; an empty string closes the connection without answering.
class LoopbackServer {
public:
    using Handler = std::function<std::string(const ReceivedRequest&)>;

    explicit LoopbackServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket failed");

        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(listen_fd_, 64) < 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        acceptor_ = std::thread([this] { accept_loop(); });
    }

    ~LoopbackServer() { stop(); }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    int port() const { return port_; }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    int connections_accepted() const { return accepted_; }
    int requests_served() const { return served_; }

    std::vector<ReceivedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    void stop() {
        if (stopping_.exchange(true)) return;

        if (acceptor_.joinable()) acceptor_.join();
        ::close(listen_fd_);

        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int fd : client_fds_) ::shutdown(fd, SHUT_RDWR);
            workers.swap(workers_);
        }
        for (auto& t : workers) {
            if (t.joinable()) t.join();
        }
    }

    static std::string response(int status,
                                const std::string& body,
                                const std::map<std::string, std::string>& headers = {},
                                const std::string& reason = "OK") {
        std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
        bool has_length = false;
        for (const auto& h : headers) {
            out += h.first + ": " + h.second + "\r\n";
            std::string lower = h.first;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower == "content-length" || lower == "transfer-encoding") has_length = true;
        }
        if (!has_length) {
            out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        }
        out += "\r\n";
        return out + body;
    }

    static std::string json(int status, const std::string& body,
                            std::map<std::string, std::string> headers = {}) {
        headers.emplace("Content-Type", "application/json");
        return response(status, body, headers, status == 200 ? "OK" : "Status");
    }

private:
    void accept_loop() {
        while (!stopping_) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            int ready = ::poll(&pfd, 1, 20);
            if (ready <= 0) continue;

            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) continue;

            ++accepted_;
            std::lock_guard<std::mutex> lock(mutex_);
            client_fds_.push_back(fd);
            workers_.emplace_back([this, fd] { serve(fd); });
        }
    }

    bool fill(int fd, std::string& buffer) {
        char chunk[16384];
        while (!stopping_) {
            pollfd pfd{fd, POLLIN, 0};
            int ready = ::poll(&pfd, 1, 20);
            if (ready == 0) continue;
            if (ready < 0) return false;
            ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) return false;
            buffer.append(chunk, static_cast<size_t>(n));
            return true;
        }
        return false;
    }

    void serve(int fd) {
        std::string buffer;
        while (!stopping_) {
            size_t head_end;
            while ((head_end = buffer.find("\r\n\r\n")) == std::string::npos) {
                if (!fill(fd, buffer)) {
                    finish(fd);
                    return;
                }
            }

            ReceivedRequest req;
            std::string head = buffer.substr(0, head_end);
            buffer.erase(0, head_end + 4);

            size_t line_end = head.find("\r\n");
            std::string request_line = head.substr(0, line_end);
            size_t sp1 = request_line.find(' ');
            size_t sp2 = request_line.find(' ', sp1 + 1);
            req.method = request_line.substr(0, sp1);
            req.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);

            size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
            while (pos < head.size()) {
                size_t next = head.find("\r\n", pos);
                if (next == std::string::npos) next = head.size();
                std::string line = head.substr(pos, next - pos);
                size_t colon = line.find(':');
                if (colon != std::string::npos) {
                    std::string name = line.substr(0, colon);
                    std::transform(name.begin(), name.end(), name.begin(),
                                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                    size_t vstart = line.find_first_not_of(' ', colon + 1);
                    req.headers[name] = vstart == std::string::npos ? "" : line.substr(vstart);
                }
                pos = next + 2;
            }

            size_t length = std::strtoul(req.header("content-length").c_str(), nullptr, 10);
            while (buffer.size() < length) {
                if (!fill(fd, buffer)) {
                    finish(fd);
                    return;
                }
            }
            req.body = buffer.substr(0, length);
            buffer.erase(0, length);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(req);
            }

            std::string reply = handler_(req);
            if (reply.empty()) {
                finish(fd);
                return;
            }

            size_t sent = 0;
            while (sent < reply.size()) {
                ssize_t n = ::send(fd, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) {
                    finish(fd);
                    return;
                }
                sent += static_cast<size_t>(n);
            }
            ++served_;

            std::string lower = reply.substr(0, reply.find("\r\n\r\n"));
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower.find("connection: close") != std::string::npos ||
                req.header("connection") == "close") {
                finish(fd);
                return;
            }
        }
        finish(fd);
    }

    void finish(int fd) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(client_fds_.begin(), client_fds_.end(), fd);
        if (it != client_fds_.end()) {
            client_fds_.erase(it);
            ::close(fd);
        }
    }

    Handler handler_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<int> accepted_{0};
    std::atomic<int> served_{0};

    std::thread acceptor_;
    std::vector<std::thread> workers_;
    std::vector<int> client_fds_;
    std::vector<ReceivedRequest> requests_;
    mutable std::mutex mutex_;
};

} // namespace test_support
} // namespace tollgate
