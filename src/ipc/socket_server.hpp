/**
 * execbox Socket Server
 *
 * Unix-domain stream listener. Each connection gets its own thread, so a
 * long EXECUTE on one client never stalls another; the number of
 * simultaneous connections is bounded.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <thread>
#include <mutex>
#include <atomic>
#include <cstdint>
#include "ipc/protocol.hpp"
#include "util/unique_fd.hpp"

namespace execbox::ipc {

// Who sent a message
struct ClientContext {
    uint32_t client_id;
    int fd;                 // Connection socket, valid while the handler runs
};

using MessageHandler = std::function<Message(const Message&, const ClientContext&)>;

class SocketServer {
public:
    explicit SocketServer(const std::string& socket_path, size_t max_connections = 64);
    ~SocketServer();

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Bind and listen; false on failure (logged)
    bool init();

    void set_handler(MessageHandler handler);

    // Accept connections until request_stop()/stop()
    void run();

    // Async-signal-safe: makes run() return
    void request_stop();

    // Close listener and every client, join all connection threads
    void stop();

    size_t client_count() const;
    const std::string& socket_path() const { return socket_path_; }

private:
    struct ClientConnection {
        util::UniqueFd fd;
        uint32_t client_id;
        std::vector<uint8_t> recv_buffer;
        std::thread thread;
        std::atomic<bool> done{false};

        ClientConnection(int f, uint32_t id) : fd(f), client_id(id) {}
    };

    void accept_connection();
    void serve_client(ClientConnection& client);
    bool process_messages(ClientConnection& client);
    bool send_all(ClientConnection& client, const std::vector<uint8_t>& data);
    void reap_finished();

    std::string socket_path_;
    size_t max_connections_;
    util::UniqueFd server_fd_;
    util::UniqueFd wake_fd_;
    MessageHandler handler_;
    std::atomic<bool> running_{false};

    mutable std::mutex clients_mutex_;
    std::vector<std::unique_ptr<ClientConnection>> clients_;
    uint32_t next_client_id_ = 1;
};

} // namespace execbox::ipc
