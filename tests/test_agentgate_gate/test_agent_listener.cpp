/**
 * @file test_agent_listener.cpp
 * @brief Listener over loopback TCP: selector routing, admission, shutdown.
 */
#include "test_helpers.h"

#include "agent_listener.hpp"
#include "byte_stream.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <system_error>
#include <thread>

using namespace agentgate::gate;
using namespace agentgate::tests::helper;
using ::testing::HasSubstr;

namespace
{

/// Protocol that records every socket it is handed and holds it open.
class RecordingProtocol final : public AgentProtocol
{
  public:
    explicit RecordingProtocol(std::string name) : name_(std::move(name)) {}

    std::string name() const override { return name_; }

    void handle_connection(SocketPtr socket) override
    {
        std::lock_guard<std::mutex> lock(mu_);
        sockets_.push_back(std::move(socket));
    }

    size_t handled() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return sockets_.size();
    }

  private:
    std::string name_;
    mutable std::mutex mu_;
    std::vector<SocketPtr> sockets_;
};

/// Protocol that takes the socket over, then answers on it after a pause.
class HandoffProtocol final : public AgentProtocol
{
  public:
    std::string name() const override { return "Agent-connect"; }

    void handle_connection(SocketPtr socket) override
    {
        if (!socket->hand_over())
            return;
        handed_over_.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        SocketOutputStream out(socket);
        write_line(out, "still here");
    }

    bool handed_over() const { return handed_over_.load(); }

  private:
    std::atomic<bool> handed_over_{false};
};

} // namespace

class AgentListenerTest : public ::testing::Test
{
  protected:
    void TearDown() override { stop_listener(); }

    void start_listener(AgentListener::Config cfg = {})
    {
        cfg.bind_address = "127.0.0.1";
        cfg.port = 0;
        std::promise<uint16_t> ready;
        auto ready_future = ready.get_future();
        cfg.on_ready = [&ready](uint16_t port) { ready.set_value(port); };

        listener_ = std::make_unique<AgentListener>(std::move(cfg));
        for (auto &p : protocols_)
            listener_->register_protocol(p);

        run_result_ = std::async(std::launch::async, [this]() { listener_->run(); });
        ASSERT_EQ(ready_future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        port_ = ready_future.get();
        ASSERT_NE(port_, 0);
        EXPECT_EQ(listener_->bound_port(), port_);
    }

    void stop_listener()
    {
        if (listener_)
        {
            listener_->stop();
            if (run_result_.valid())
            {
                ASSERT_EQ(run_result_.wait_for(std::chrono::seconds(5)), std::future_status::ready);
                run_result_.get();
            }
            listener_.reset();
        }
    }

    ConnectionServices agent_services()
    {
        ConnectionServices s;
        s.registry = registry_;
        s.secrets = std::make_shared<StaticSecretStore>("s3cr3t");
        s.log_sink = std::make_shared<FileAgentLogSink>(dir_ / "agents");
        s.transport = transport_;
        return s;
    }

    TempDir dir_{"agentgate_listener"};
    std::shared_ptr<WorkerRegistry> registry_ =
        std::make_shared<WorkerRegistry>(std::vector<std::string>{"agent-1"});
    std::shared_ptr<ScriptedTransport> transport_ = std::make_shared<ScriptedTransport>();
    std::vector<std::shared_ptr<AgentProtocol>> protocols_;

    std::unique_ptr<AgentListener> listener_;
    std::future<void> run_result_;
    uint16_t port_ = 0;
};

TEST_F(AgentListenerTest, AgentConnectHandshakeOverTcp)
{
    protocols_.push_back(std::make_shared<AgentConnectProtocol>(agent_services()));
    start_listener();

    SocketPtr socket = tcp_connect(port_);
    ASSERT_NE(socket, nullptr);
    AgentClient agent(socket);
    agent.send_selector("Agent-connect");
    agent.send_secret("s3cr3t");
    agent.send_name("agent-1");
    EXPECT_EQ(agent.read_line(), std::optional<std::string>("Welcome"));

    EXPECT_TRUE(wait_until([&]() { return registry_->lookup("agent-1")->current_channel() != nullptr; }));
    EXPECT_EQ(transport_->establish_calls(), 1);
    EXPECT_THAT(read_file(dir_ / "agents" / "agent-1.log"), HasSubstr("Agent connected from 127.0.0.1:"));
}

TEST_F(AgentListenerTest, RejectionOverTcp)
{
    protocols_.push_back(std::make_shared<AgentConnectProtocol>(agent_services()));
    start_listener();

    SocketPtr socket = tcp_connect(port_);
    ASSERT_NE(socket, nullptr);
    AgentClient agent(socket);
    agent.send_selector("Agent-connect");
    agent.send_secret("s3cr3t");
    agent.send_name("nobody");
    EXPECT_EQ(agent.read_line(), std::optional<std::string>("No such slave: nobody"));
    EXPECT_TRUE(agent.at_eof());
    EXPECT_EQ(transport_->establish_calls(), 0);
}

TEST_F(AgentListenerTest, UnknownSelectorIsAnsweredAndClosed)
{
    auto recorder = std::make_shared<RecordingProtocol>("Agent-connect");
    protocols_.push_back(recorder);
    start_listener();

    LogCapture logs;
    SocketPtr socket = tcp_connect(port_);
    ASSERT_NE(socket, nullptr);
    AgentClient agent(socket);
    agent.send_selector("Bogus-protocol");
    EXPECT_EQ(agent.read_line(), std::optional<std::string>("Unknown protocol:Protocol:Bogus-protocol"));
    EXPECT_TRUE(agent.at_eof());
    EXPECT_EQ(recorder->handled(), 0u);
    EXPECT_TRUE(wait_until([&]() { return logs.count("requested unknown protocol") == 1; }));
}

TEST_F(AgentListenerTest, SelectorWithoutPrefixIsUnknown)
{
    auto recorder = std::make_shared<RecordingProtocol>("Agent-connect");
    protocols_.push_back(recorder);
    start_listener();

    SocketPtr socket = tcp_connect(port_);
    ASSERT_NE(socket, nullptr);
    AgentClient agent(socket);
    agent.send_secret("Agent-connect");
    EXPECT_EQ(agent.read_line(), std::optional<std::string>("Unknown protocol:Agent-connect"));
    EXPECT_EQ(recorder->handled(), 0u);
}

TEST_F(AgentListenerTest, RoutesByProtocolName)
{
    auto first = std::make_shared<RecordingProtocol>("First");
    auto second = std::make_shared<RecordingProtocol>("Second");
    protocols_ = {first, second};
    start_listener();

    SocketPtr a = tcp_connect(port_);
    SocketPtr b = tcp_connect(port_);
    SocketPtr c = tcp_connect(port_);
    ASSERT_TRUE(a && b && c);
    AgentClient(a).send_selector("Second");
    AgentClient(b).send_selector("First");
    AgentClient(c).send_selector("Second");

    EXPECT_TRUE(wait_until([&]() { return first->handled() == 1 && second->handled() == 2; }));
}

TEST_F(AgentListenerTest, DuplicateOrNullProtocolIsRejected)
{
    AgentListener listener(AgentListener::Config{});
    listener.register_protocol(std::make_shared<RecordingProtocol>("Agent-connect"));
    EXPECT_THROW(listener.register_protocol(std::make_shared<RecordingProtocol>("Agent-connect")),
                 std::invalid_argument);
    EXPECT_THROW(listener.register_protocol(nullptr), std::invalid_argument);
}

TEST_F(AgentListenerTest, StopInterruptsHandshakesInProgress)
{
    protocols_.push_back(std::make_shared<AgentConnectProtocol>(agent_services()));
    start_listener();

    // Selector sent, then silence: the handler blocks reading the secret.
    SocketPtr socket = tcp_connect(port_);
    ASSERT_NE(socket, nullptr);
    AgentClient agent(socket);
    agent.send_selector("Agent-connect");
    ASSERT_TRUE(wait_until([&]() { return listener_->active_connections() == 1; }));

    listener_->stop();
    ASSERT_EQ(run_result_.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    run_result_.get();
    EXPECT_EQ(listener_->active_connections(), 0u);
    EXPECT_TRUE(agent.at_eof());
    EXPECT_FALSE(registry_->lookup("agent-1")->is_reserved());
}

TEST_F(AgentListenerTest, SelectorTimeoutDropsSilentClients)
{
    protocols_.push_back(std::make_shared<RecordingProtocol>("Agent-connect"));
    AgentListener::Config cfg;
    cfg.selector_timeout = std::chrono::milliseconds(100);
    start_listener(std::move(cfg));

    SocketPtr socket = tcp_connect(port_);
    ASSERT_NE(socket, nullptr);
    AgentClient agent(socket);
    EXPECT_TRUE(wait_until([&]() { return listener_->active_connections() == 0; }));
    EXPECT_TRUE(agent.at_eof());
}

TEST_F(AgentListenerTest, PortInUseFailsToStart)
{
    protocols_.push_back(std::make_shared<RecordingProtocol>("Agent-connect"));
    start_listener();

    AgentListener::Config cfg;
    cfg.bind_address = "127.0.0.1";
    cfg.port = port_;
    AgentListener second(std::move(cfg));
    EXPECT_THROW(second.run(), std::system_error);
}

TEST_F(AgentListenerTest, StopLeavesHandedOverSocketsAlone)
{
    auto protocol = std::make_shared<HandoffProtocol>();
    protocols_.push_back(protocol);
    start_listener();

    SocketPtr socket = tcp_connect(port_);
    ASSERT_NE(socket, nullptr);
    AgentClient agent(socket);
    agent.send_selector("Agent-connect");
    ASSERT_TRUE(wait_until([&]() { return protocol->handed_over(); }));

    stop_listener();
    EXPECT_EQ(agent.read_line(), std::optional<std::string>("still here"));
}

TEST_F(AgentListenerTest, ThreadStartFailureDropsOnlyThatConnection)
{
    auto recorder = std::make_shared<RecordingProtocol>("Agent-connect");
    protocols_.push_back(recorder);

    AgentListener::Config cfg;
    auto starts = std::make_shared<std::atomic<int>>(0);
    cfg.start_thread = [starts](std::function<void()> body)
    {
        if (starts->fetch_add(1) == 0)
        {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread start");
        }
        return std::thread(std::move(body));
    };

    LogCapture logs;
    start_listener(std::move(cfg));

    SocketPtr first = tcp_connect(port_);
    ASSERT_NE(first, nullptr);
    AgentClient dropped(first);
    EXPECT_TRUE(dropped.at_eof());
    EXPECT_TRUE(wait_until([&]() { return logs.count("no thread for connection") == 1; }));

    SocketPtr second = tcp_connect(port_);
    ASSERT_NE(second, nullptr);
    AgentClient(second).send_selector("Agent-connect");
    EXPECT_TRUE(wait_until([&]() { return recorder->handled() == 1; }));
    EXPECT_TRUE(wait_until([&]() { return listener_->active_connections() == 0; }));
    EXPECT_EQ(run_result_.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);
    EXPECT_EQ(starts->load(), 2);
}
