#include "blobvault/control_server.hpp"
#include "blobvault/errors.hpp"
#include "blobvault/file_service.hpp"
#include "blobvault/log.hpp"
#include "blobvault/net/http.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace blobvault {

namespace {

std::vector<std::string> split_tokens(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream in(line);
    std::string token;
    while (in >> token) {
        tokens.push_back(net::url_decode(token));
    }
    return tokens;
}

// Empty strings travel as %00, which decodes back to ""
std::string encode_token(const std::string& value) {
    return value.empty() ? "%00" : net::url_encode(value);
}

// Messages travel on a single line
std::string one_line(std::string message) {
    for (auto& c : message) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return message;
}

bool send_all(int fd, const void* data, size_t size) {
    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = send(fd, p, size, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

// Read until the buffer holds `want` bytes. False on EOF, error or timeout.
bool recv_until(int fd, std::string& buffer, size_t want) {
    char chunk[8192];
    while (buffer.size() < want) {
        ssize_t n = recv(fd, chunk, std::min(sizeof(chunk), want - buffer.size()), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        buffer.append(chunk, static_cast<size_t>(n));
    }
    return true;
}

}  // namespace

ControlServer::ControlServer(FileService& service,
                             std::filesystem::path socket_path,
                             size_t worker_threads)
    : service_(service)
    , socket_path_(std::move(socket_path))
    , worker_count_(worker_threads == 0 ? 1 : worker_threads) {}

ControlServer::~ControlServer() {
    stop();
}

std::string ControlServer::start() {
    if (running_.load()) return "";

    if (socket_path_.native().size() >= sizeof(sockaddr_un::sun_path)) {
        return "socket path too long: " + socket_path_.string();
    }

    std::error_code ec;
    std::filesystem::create_directories(socket_path_.parent_path(), ec);
    if (ec) {
        return "cannot create " + socket_path_.parent_path().string() + ": " + ec.message();
    }

    // Remove stale socket
    unlink(socket_path_.c_str());

    listen_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        return std::string("failed to create control socket: ") + strerror(errno);
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = std::string("failed to bind control socket: ") + strerror(errno);
        close(listen_fd_);
        listen_fd_ = -1;
        return err;
    }

    if (listen(listen_fd_, 64) < 0) {
        std::string err = std::string("failed to listen on control socket: ") + strerror(errno);
        close(listen_fd_);
        listen_fd_ = -1;
        return err;
    }

    // Front-end may run as a different user in the same group
    chmod(socket_path_.c_str(), 0660);

    running_.store(true);
    for (size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back(&ControlServer::worker_loop, this);
    }
    accept_thread_ = std::thread(&ControlServer::accept_loop, this);

    log_info("control server listening on %s (%zu workers)", socket_path_.c_str(), worker_count_);
    return "";
}

void ControlServer::stop() {
    {
        // Workers test running_ under this mutex before blocking
        std::lock_guard lock(queue_mutex_);
        if (!running_.exchange(false)) return;
    }

    // Wakes the blocked accept()
    shutdown(listen_fd_, SHUT_RDWR);
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    close(listen_fd_);
    listen_fd_ = -1;

    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();

    unlink(socket_path_.c_str());
    log_info("control server stopped");
}

void ControlServer::accept_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            if (!running_.load()) break;
            log_error("control accept failed: %s", strerror(errno));
            continue;
        }

        struct timeval tv;
        tv.tv_sec = 30;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        {
            std::lock_guard lock(queue_mutex_);
            pending_.push(client_fd);
        }
        queue_cv_.notify_one();
    }
}

void ControlServer::worker_loop() {
    while (true) {
        int fd = -1;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !pending_.empty() || !running_.load(); });
            if (pending_.empty()) break;  // stopped and drained
            fd = pending_.front();
            pending_.pop();
        }
        handle_connection(fd);
        close(fd);
    }
}

void ControlServer::handle_connection(int fd) {
    std::string buffer;
    size_t newline = std::string::npos;
    char chunk[1024];

    while ((newline = buffer.find('\n')) == std::string::npos) {
        if (buffer.size() > MAX_HEADER_BYTES) {
            std::string reply = "INVALID request header too long\n";
            send_all(fd, reply.data(), reply.size());
            return;
        }
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            if (buffer.empty()) return;  // client went away
            newline = buffer.size();
            buffer += '\n';
            break;
        }
        buffer.append(chunk, static_cast<size_t>(n));
    }

    std::string header = buffer.substr(0, newline);
    if (!header.empty() && header.back() == '\r') header.pop_back();
    std::string rest = buffer.substr(newline + 1);

    auto tokens = split_tokens(header);
    std::vector<uint8_t> body;
    Reply reply;

    if (!tokens.empty() && tokens[0] == "PUT") {
        uint64_t size = 0;
        if (tokens.size() != 5) {
            reply.header = "INVALID usage: PUT <origin> <size> <content-type> <name>";
        } else {
            try {
                size_t used = 0;
                size = std::stoull(tokens[2], &used);
                if (used != tokens[2].size()) throw std::invalid_argument(tokens[2]);
            } catch (const std::exception&) {
                reply.header = "INVALID bad size";
            }
            if (reply.header.empty() && size > MAX_BODY_BYTES) {
                reply.header = "INVALID body exceeds " + std::to_string(MAX_BODY_BYTES) + " bytes";
            }
            if (reply.header.empty()) {
                if (!recv_until(fd, rest, size)) {
                    reply.header = "INVALID truncated body";
                } else {
                    body.assign(rest.begin(), rest.begin() + static_cast<std::ptrdiff_t>(size));
                }
            }
        }
    }

    if (reply.header.empty()) {
        reply = dispatch(tokens, body);
    }

    reply.header += '\n';
    if (send_all(fd, reply.header.data(), reply.header.size()) && !reply.body.empty()) {
        send_all(fd, reply.body.data(), reply.body.size());
    }
}

ControlServer::Reply ControlServer::dispatch(const std::vector<std::string>& tokens,
                                             std::vector<uint8_t>& body) {
    Reply reply;
    if (tokens.empty()) {
        reply.header = "INVALID empty request";
        return reply;
    }

    const std::string& command = tokens[0];
    try {
        if (command == "PUT") {
            auto keys = service_.upload(tokens[1], body, tokens[4], tokens[3]);
            reply.header = "OK " + keys.public_key + " " + keys.private_key;
        } else if (command == "GET" && tokens.size() == 3) {
            auto blob = service_.download(tokens[1], tokens[2]);
            reply.header = "OK " + std::to_string(blob.content.size()) + " " +
                           encode_token(blob.content_type) + " " +
                           encode_token(blob.original_name);
            reply.body = std::move(blob.content);
        } else if (command == "DEL" && tokens.size() == 2) {
            reply.header = service_.remove(tokens[1]) ? "OK" : "NOTFOUND";
        } else if (command == "USAGE" && tokens.size() == 2) {
            auto u = service_.usage(tokens[1]);
            reply.header = "OK " + std::to_string(u.uploaded) + " " + std::to_string(u.downloaded) +
                           " " + std::to_string(u.upload_limit) + " " +
                           std::to_string(u.download_limit);
        } else if (command == "HEALTH" && tokens.size() == 1) {
            auto& store = service_.store();
            reply.header = store.is_healthy() ? "OK " + store.backend_type()
                                              : "ERROR backend unavailable";
        } else {
            reply.header = "INVALID unknown command or wrong arguments: " + one_line(command);
        }
    } catch (const NotFoundError&) {
        reply.header = "NOTFOUND";
    } catch (const LimitExceededError& e) {
        reply.header = std::string("LIMIT ") +
            (e.direction() == LimitExceededError::Direction::Upload ? "upload" : "download") +
            " " + std::to_string(e.used()) + " " + std::to_string(e.limit());
    } catch (const ValidationError& e) {
        reply.header = "INVALID " + one_line(e.what());
    } catch (const std::exception& e) {
        log_error("control %s failed: %s", command.c_str(), e.what());
        reply.header = "ERROR " + one_line(e.what());
    }
    return reply;
}

}  // namespace blobvault
