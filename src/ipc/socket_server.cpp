#include "ipc/socket_server.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/eventfd.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace execbox::ipc {

SocketServer::SocketServer(const std::string& socket_path, size_t max_connections)
    : socket_path_(socket_path),
      max_connections_(max_connections),
      wake_fd_(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)) {
    if (!wake_fd_.is_open()) {
        spdlog::warn("Failed to create wake eventfd: {}", strerror(errno));
    }
}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::init() {
    if (socket_path_.size() >= sizeof(sockaddr_un::sun_path)) {
        spdlog::error("Socket path too long: {}", socket_path_);
        return false;
    }

    // Remove stale socket file
    unlink(socket_path_.c_str());

    server_fd_.reset(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!server_fd_.is_open()) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    // Listener is non-blocking; connections are served blocking on their own threads
    int flags = fcntl(server_fd_.get(), F_GETFL, 0);
    if (fcntl(server_fd_.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        spdlog::error("Failed to set non-blocking: {}", strerror(errno));
        server_fd_.reset();
        return false;
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_.get(), (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("Failed to bind socket {}: {}", socket_path_, strerror(errno));
        server_fd_.reset();
        return false;
    }

    if (listen(server_fd_.get(), 16) < 0) {
        spdlog::error("Failed to listen: {}", strerror(errno));
        server_fd_.reset();
        unlink(socket_path_.c_str());
        return false;
    }

    running_ = true;
    spdlog::info("Socket server listening on {} (max_connections={})",
                 socket_path_, max_connections_);
    return true;
}

void SocketServer::set_handler(MessageHandler handler) {
    handler_ = std::move(handler);
}

void SocketServer::run() {
    if (!server_fd_.is_open()) {
        spdlog::error("Socket server not initialized");
        return;
    }

    while (running_) {
        struct pollfd fds[2];
        fds[0] = {server_fd_.get(), POLLIN, 0};
        fds[1] = {wake_fd_.get(), POLLIN, 0};

        int ready = poll(fds, 2, 1000);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed on listener: {}", strerror(errno));
            break;
        }

        if (fds[1].revents & POLLIN) {
            break;
        }
        if (fds[0].revents & POLLIN) {
            accept_connection();
        }
        reap_finished();
    }

    spdlog::debug("Socket server accept loop exited");
}

void SocketServer::request_stop() {
    running_ = false;
    if (wake_fd_.is_open()) {
        uint64_t one = 1;
        // Called from signal handlers: nothing useful to do on failure,
        // the accept loop notices running_ within its poll timeout
        if (write(wake_fd_.get(), &one, sizeof(one)) < 0) {
            return;
        }
    }
}

void SocketServer::accept_connection() {
    while (true) {
        int client_fd = accept4(server_fd_.get(), nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                spdlog::error("Failed to accept: {}", strerror(errno));
            }
            return;
        }

        std::lock_guard<std::mutex> lock(clients_mutex_);

        size_t active = 0;
        for (const auto& c : clients_) {
            if (!c->done) {
                ++active;
            }
        }
        if (active >= max_connections_) {
            spdlog::warn("Connection limit reached ({}), refusing client", max_connections_);
            close(client_fd);
            continue;
        }

        uint32_t client_id = next_client_id_++;
        clients_.push_back(std::make_unique<ClientConnection>(client_fd, client_id));
        ClientConnection& client = *clients_.back();
        client.thread = std::thread([this, &client]() { serve_client(client); });

        spdlog::info("Client {} connected (fd={})", client_id, client_fd);
    }
}

void SocketServer::serve_client(ClientConnection& client) {
    uint8_t buffer[4096];

    while (true) {
        ssize_t n = read(client.fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            client.recv_buffer.insert(client.recv_buffer.end(), buffer, buffer + n);
            if (!process_messages(client)) {
                break;
            }
        } else if (n == 0) {
            spdlog::info("Client {} disconnected", client.client_id);
            break;
        } else {
            if (errno == EINTR) {
                continue;
            }
            spdlog::debug("Read error for client {}: {}", client.client_id, strerror(errno));
            break;
        }
    }

    // Close under the lock so stop() never shuts down a reused descriptor
    std::lock_guard<std::mutex> lock(clients_mutex_);
    client.fd.reset();
    client.done = true;
}

bool SocketServer::process_messages(ClientConnection& client) {
    while (client.recv_buffer.size() >= HEADER_SIZE) {
        auto msg_size = Message::get_message_size(
            client.recv_buffer.data(),
            client.recv_buffer.size()
        );

        if (!msg_size) {
            // Bad magic or oversized payload; the stream cannot be resynchronized
            spdlog::warn("Invalid frame from client {}, closing connection", client.client_id);
            return false;
        }
        if (client.recv_buffer.size() < *msg_size) {
            break; // Need more data
        }

        auto msg = Message::deserialize(
            client.recv_buffer.data(),
            client.recv_buffer.size()
        );
        client.recv_buffer.erase(
            client.recv_buffer.begin(),
            client.recv_buffer.begin() + *msg_size
        );
        if (!msg) {
            spdlog::warn("Invalid message from client {}", client.client_id);
            return false;
        }

        spdlog::debug("Client {} -> {} tag={} ({}B payload)",
            client.client_id,
            opcode_to_string(msg->opcode),
            msg->request_tag,
            msg->payload.size()
        );

        if (!handler_) {
            spdlog::warn("No handler installed, dropping {}", opcode_to_string(msg->opcode));
            continue;
        }

        Message response;
        try {
            response = handler_(*msg, ClientContext{client.client_id, client.fd.get()});
        } catch (const std::exception& e) {
            spdlog::error("Handler failed for client {}: {}", client.client_id, e.what());
            return false;
        }
        response.request_tag = msg->request_tag;
        response.opcode = msg->opcode;

        if (!send_all(client, response.serialize())) {
            return false;
        }

        spdlog::debug("Client {} <- {} tag={} ({}B payload)",
            client.client_id,
            opcode_to_string(response.opcode),
            response.request_tag,
            response.payload.size()
        );
    }
    return true;
}

bool SocketServer::send_all(ClientConnection& client, const std::vector<uint8_t>& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(client.fd.get(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::debug("Write error for client {}: {}", client.client_id, strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void SocketServer::reap_finished() {
    std::vector<std::unique_ptr<ClientConnection>> finished;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto it = clients_.begin(); it != clients_.end();) {
            if ((*it)->done) {
                finished.push_back(std::move(*it));
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& client : finished) {
        if (client->thread.joinable()) {
            client->thread.join();
        }
    }
}

void SocketServer::stop() {
    request_stop();

    std::vector<std::unique_ptr<ClientConnection>> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (auto& client : clients_) {
            if (client->fd.is_open()) {
                // Wakes the blocking read and signals hang-up to a running sandbox
                shutdown(client->fd.get(), SHUT_RDWR);
            }
        }
        clients.swap(clients_);
    }

    if (!clients.empty()) {
        spdlog::info("Closing {} client connection(s)", clients.size());
    }
    for (auto& client : clients) {
        if (client->thread.joinable()) {
            client->thread.join();
        }
    }

    if (server_fd_.is_open()) {
        server_fd_.reset();
        unlink(socket_path_.c_str());
        spdlog::info("Socket server stopped");
    }
}

size_t SocketServer::client_count() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    size_t active = 0;
    for (const auto& client : clients_) {
        if (!client->done) {
            ++active;
        }
    }
    return active;
}

} // namespace execbox::ipc
