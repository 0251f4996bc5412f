#include <gtest/gtest.h>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <optional>
#include <thread>
#include <vector>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/time.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "ipc/socket_server.hpp"
#include "service/service.hpp"
#include "test_support.hpp"

using namespace execbox;
using namespace std::chrono_literals;
using json = nlohmann::json;
using execbox::testing::TempDir;

namespace {

// Blocking client with a receive timeout so a broken server fails the test
class TestClient {
public:
    explicit TestClient(const std::string& path) {
        fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd_);
            fd_ = -1;
            return;
        }
        timeval tv{10, 0};
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }
    ~TestClient() {
        if (fd_ >= 0) close(fd_);
    }

    bool connected() const { return fd_ >= 0; }

    bool send_raw(const std::vector<uint8_t>& data) {
        return send(fd_, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
    }

    bool send_message(const ipc::Message& msg) { return send_raw(msg.serialize()); }

    // One frame per call; bytes of later frames stay buffered
    std::optional<ipc::Message> receive() {
        uint8_t chunk[4096];
        while (true) {
            auto size = ipc::Message::get_message_size(buffer_.data(), buffer_.size());
            if (size && buffer_.size() >= *size) {
                auto msg = ipc::Message::deserialize(buffer_.data(), *size);
                buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(*size));
                return msg;
            }
            ssize_t n = read(fd_, chunk, sizeof(chunk));
            if (n <= 0) {
                return std::nullopt;
            }
            buffer_.insert(buffer_.end(), chunk, chunk + n);
        }
    }

    // True once the server has closed its end
    bool closed_by_peer() {
        uint8_t byte;
        return read(fd_, &byte, 1) == 0;
    }

private:
    int fd_ = -1;
    std::vector<uint8_t> buffer_;
};

bool wait_for_file(const std::string& path) {
    for (int i = 0; i < 300; ++i) {
        if (std::filesystem::exists(path)) return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

} // namespace

// ============================================================================
// SocketServer
// ============================================================================

class SocketServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = dir_.path() + "/server.sock";
        server_ = std::make_unique<ipc::SocketServer>(path_, 2);
    }

    void start() {
        ASSERT_TRUE(server_->init());
        thread_ = std::thread([this]() { server_->run(); });
    }

    void TearDown() override {
        server_->stop();
        if (thread_.joinable()) thread_.join();
    }

    TempDir dir_;
    std::string path_;
    std::unique_ptr<ipc::SocketServer> server_;
    std::thread thread_;
};

TEST_F(SocketServerTest, ResponseEchoesTagAndOpcode) {
    server_->set_handler([](const ipc::Message& msg, const ipc::ClientContext&) {
        return ipc::Message(0, ipc::Opcode::PING, "echo:" + msg.payload_str());
    });
    start();

    TestClient client(path_);
    ASSERT_TRUE(client.connected());
    ASSERT_TRUE(client.send_message(ipc::Message(77, ipc::Opcode::STATS, "hi")));

    auto reply = client.receive();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->request_tag, 77u);
    EXPECT_EQ(reply->opcode, ipc::Opcode::STATS);
    EXPECT_EQ(reply->payload_str(), "echo:hi");
}

TEST_F(SocketServerTest, PipelinedRequestsAnsweredInOrder) {
    server_->set_handler([](const ipc::Message& msg, const ipc::ClientContext&) {
        return ipc::Message(0, msg.opcode, msg.payload_str());
    });
    start();

    TestClient client(path_);
    ASSERT_TRUE(client.connected());
    auto a = ipc::Message(1, ipc::Opcode::PING, "first").serialize();
    auto b = ipc::Message(2, ipc::Opcode::PING, "second").serialize();
    a.insert(a.end(), b.begin(), b.end());
    ASSERT_TRUE(client.send_raw(a));

    auto r1 = client.receive();
    ASSERT_TRUE(r1.has_value());
    EXPECT_EQ(r1->request_tag, 1u);
    auto r2 = client.receive();
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(r2->request_tag, 2u);
    EXPECT_EQ(r2->payload_str(), "second");
}

TEST_F(SocketServerTest, InvalidFrameClosesTheConnection) {
    server_->set_handler([](const ipc::Message& msg, const ipc::ClientContext&) { return msg; });
    start();

    TestClient client(path_);
    ASSERT_TRUE(client.connected());
    ASSERT_TRUE(client.send_raw(std::vector<uint8_t>(ipc::HEADER_SIZE, 0xab)));
    EXPECT_TRUE(client.closed_by_peer());
}

TEST_F(SocketServerTest, SlowHandlerDoesNotBlockOtherClients) {
    server_->set_handler([](const ipc::Message& msg, const ipc::ClientContext&) {
        if (msg.payload_str() == "slow") {
            std::this_thread::sleep_for(1500ms);
        }
        return msg;
    });
    start();

    TestClient slow(path_);
    TestClient fast(path_);
    ASSERT_TRUE(slow.connected());
    ASSERT_TRUE(fast.connected());

    ASSERT_TRUE(slow.send_message(ipc::Message(1, ipc::Opcode::EXECUTE, "slow")));
    std::this_thread::sleep_for(50ms);

    auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(fast.send_message(ipc::Message(2, ipc::Opcode::PING, "fast")));
    auto reply = fast.receive();
    ASSERT_TRUE(reply.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);

    EXPECT_TRUE(slow.receive().has_value());
}

TEST_F(SocketServerTest, StopRemovesSocketFile) {
    server_->set_handler([](const ipc::Message& msg, const ipc::ClientContext&) { return msg; });
    start();
    EXPECT_TRUE(std::filesystem::exists(path_));

    TestClient client(path_);
    ASSERT_TRUE(client.connected());
    ASSERT_TRUE(client.send_message(ipc::Message(1, ipc::Opcode::PING, "")));
    ASSERT_TRUE(client.receive().has_value());

    server_->stop();
    thread_.join();
    EXPECT_FALSE(std::filesystem::exists(path_));
    EXPECT_TRUE(client.closed_by_peer());
}

// ============================================================================
// Service over the socket
// ============================================================================

class ServiceSocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.socket_path = dir_.path() + "/execbox.sock";
        config_.policy = execbox::testing::shell_policy(dir_.path() + "/scratch");
        config_.dispatcher.max_code_bytes = 1000;
        service_ = std::make_unique<service::Service>(config_);
        ASSERT_TRUE(service_->init());
        thread_ = std::thread([this]() { drained_ = service_->run(); });
        ASSERT_TRUE(wait_for_file(config_.socket_path));
    }

    void TearDown() override {
        service_->shutdown();
        if (thread_.joinable()) thread_.join();
    }

    json call(TestClient& client, ipc::Opcode op, const json& body, uint32_t tag = 1) {
        EXPECT_TRUE(client.send_message(ipc::Message(tag, op, body.dump())));
        auto reply = client.receive();
        if (!reply) {
            ADD_FAILURE() << "no reply for " << ipc::opcode_to_string(op);
            return json();
        }
        EXPECT_EQ(reply->request_tag, tag);
        return json::parse(reply->payload_str());
    }

    TempDir dir_;
    service::ServiceConfig config_;
    std::unique_ptr<service::Service> service_;
    std::thread thread_;
    bool drained_ = false;
};

TEST_F(ServiceSocketTest, PingReportsVersionAndEngine) {
    TestClient client(config_.socket_path);
    ASSERT_TRUE(client.connected());

    json reply = call(client, ipc::Opcode::PING, json::object());
    EXPECT_EQ(reply["ok"], true);
    EXPECT_EQ(reply["version"], service::VERSION);
    EXPECT_EQ(reply["engine"], "namespace");
}

TEST_F(ServiceSocketTest, ExecuteThenHistoryAndStats) {
    TestClient client(config_.socket_path);
    ASSERT_TRUE(client.connected());

    json reply = call(client, ipc::Opcode::EXECUTE, {{"code", "echo from-sandbox\n"}}, 5);
    ASSERT_TRUE(reply.contains("outcome")) << reply.dump();
    EXPECT_EQ(reply["status"], 200);
    EXPECT_EQ(reply["outcome"]["status"], "success");
    EXPECT_EQ(reply["outcome"]["stdout"], "from-sandbox\n");

    json history = call(client, ipc::Opcode::HISTORY, {{"limit", 10}}, 6);
    ASSERT_EQ(history["records"].size(), 1u);
    EXPECT_EQ(history["records"][0]["request_id"], reply["outcome"]["request_id"]);
    EXPECT_FALSE(history["records"][0].contains("stdout"));

    json stats = call(client, ipc::Opcode::STATS, json::object(), 7);
    EXPECT_EQ(stats["dispatcher"]["completed"], 1);
    EXPECT_EQ(stats["history_count"], 1);
    EXPECT_EQ(stats["clients"], 1);
}

TEST_F(ServiceSocketTest, ExecuteProjectRunsTheEntryPoint) {
    TestClient client(config_.socket_path);
    ASSERT_TRUE(client.connected());

    json files = json::array({
        {{"path", "main.py"}, {"content", ". \"$(dirname \"$0\")/part.sh\"\n"}},
        {{"path", "part.sh"}, {"content", "echo project-run\n"}},
    });
    json reply = call(client, ipc::Opcode::EXECUTE_PROJECT, {{"files", files}}, 4);
    ASSERT_TRUE(reply.contains("outcome")) << reply.dump();
    EXPECT_EQ(reply["status"], 200);
    EXPECT_EQ(reply["outcome"]["stdout"], "project-run\n");

    reply = call(client, ipc::Opcode::EXECUTE_PROJECT,
                 {{"files", json::array({{{"path", "lib.sh"}, {"content", "echo"}}})}}, 5);
    EXPECT_EQ(reply["status"], 400);
    EXPECT_EQ(reply["error"]["kind"], "VALIDATION");

    reply = call(client, ipc::Opcode::EXECUTE_PROJECT, {{"files", "main.py"}}, 6);
    EXPECT_EQ(reply["status"], 400);
}

TEST_F(ServiceSocketTest, MalformedRequestsGetValidationErrors) {
    TestClient client(config_.socket_path);
    ASSERT_TRUE(client.connected());

    json reply = call(client, ipc::Opcode::EXECUTE, {{"source", "echo"}});
    EXPECT_EQ(reply["ok"], false);
    EXPECT_EQ(reply["status"], 400);
    EXPECT_EQ(reply["error"]["kind"], "VALIDATION");

    reply = call(client, ipc::Opcode::EXECUTE, {{"code", ""}});
    EXPECT_EQ(reply["status"], 400);

    reply = call(client, ipc::Opcode::EXECUTE, {{"code", std::string(1001, 'x')}});
    EXPECT_EQ(reply["status"], 400);

    // Not JSON at all
    ASSERT_TRUE(client.send_message(ipc::Message(9, ipc::Opcode::EXECUTE, "{oops")));
    auto raw = client.receive();
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(json::parse(raw->payload_str())["error"]["kind"], "VALIDATION");

    // Connection stays usable
    EXPECT_EQ(call(client, ipc::Opcode::PING, json::object())["ok"], true);
}

TEST_F(ServiceSocketTest, ShutdownDrainsAndReturns) {
    TestClient client(config_.socket_path);
    ASSERT_TRUE(client.connected());
    ASSERT_TRUE(client.send_message(
        ipc::Message(3, ipc::Opcode::EXECUTE, json({{"code", "while :; do :; done\n"}}).dump())));
    std::this_thread::sleep_for(300ms);

    service_->shutdown();
    thread_.join();
    EXPECT_TRUE(drained_);
    EXPECT_FALSE(std::filesystem::exists(config_.socket_path));
}
