#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace blobvault {

class FileService;

/// Unix-domain socket front door to a FileService.
///
/// One request per connection. The request is a header line, followed for
/// PUT by exactly <size> body bytes; tokens are URL-encoded and an empty
/// value is sent as %00:
///
///   PUT <origin> <size> <content-type> <name>   -> OK <publicKey> <privateKey>
///   GET <origin> <publicKey>                    -> OK <size> <content-type> <name>\n<bytes>
///   DEL <privateKey>                            -> OK
///   USAGE <origin>                              -> OK <up> <down> <upLimit> <downLimit>
///   HEALTH                                      -> OK <backend-type>
///
/// Failures: NOTFOUND, LIMIT <upload|download> <used> <limit>,
/// INVALID <message>, ERROR <message>.
class ControlServer {
public:
    static constexpr size_t MAX_HEADER_BYTES = 4096;
    static constexpr uint64_t MAX_BODY_BYTES = 100ull * 1024 * 1024;

    ControlServer(FileService& service,
                  std::filesystem::path socket_path,
                  size_t worker_threads = 8);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    /// Bind the socket and start the accept thread and workers.
    /// Returns error message on failure, empty string on success.
    std::string start();

    /// Stop accepting, finish queued connections, remove the socket file.
    void stop();

    const std::filesystem::path& socket_path() const { return socket_path_; }

private:
    struct Reply {
        std::string header;
        std::vector<uint8_t> body;
    };

    void accept_loop();
    void worker_loop();
    void handle_connection(int fd);
    Reply dispatch(const std::vector<std::string>& tokens, std::vector<uint8_t>& body);

    FileService& service_;
    std::filesystem::path socket_path_;
    size_t worker_count_;

    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::vector<std::thread> workers_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<int> pending_;
};

}  // namespace blobvault
