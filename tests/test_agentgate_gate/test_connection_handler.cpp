/**
 * @file test_connection_handler.cpp
 * @brief Admission handshake: rejections, success, failure cleanup, close callback.
 *
 * Each test drives ConnectionHandler::run() on a background thread over a
 * socketpair while the test thread plays the agent. Channel establishment is
 * scripted (ScriptedTransport) except in the end-to-end case, which uses the
 * real StreamChannelTransport.
 */
#include "test_helpers.h"

#include "connection_handler.hpp"
#include "errors.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace agentgate::gate;
using namespace agentgate::tests::helper;
using ::testing::HasSubstr;

namespace
{

struct HandshakeOutcome
{
    HandshakeResult result;
    std::exception_ptr error;
};

std::future<HandshakeOutcome> start_handler(SocketPtr server, ConnectionServices services)
{
    return std::async(std::launch::async,
                      [server = std::move(server), services = std::move(services)]()
                      {
                          HandshakeOutcome out;
                          try
                          {
                              ConnectionHandler handler(server, services, "test-context");
                              out.result = handler.run();
                          }
                          catch (const std::exception &)
                          {
                              out.error = std::current_exception();
                          }
                          return out;
                      });
}

/// Holds every establish() call until release() so a handshake can be kept in flight.
class BlockingTransport final : public ChannelTransport
{
  public:
    ChannelPtr establish(const std::string &name, std::unique_ptr<InputStream> in,
                         std::unique_ptr<OutputStream> out, LogStreamPtr log,
                         CloseCallback on_close) override
    {
        entered_.store(true);
        std::shared_future<void> gate = gate_;
        gate.wait();
        return inner_.establish(name, std::move(in), std::move(out), std::move(log),
                                std::move(on_close));
    }

    void release() { promise_.set_value(); }
    [[nodiscard]] bool entered() const { return entered_.load(); }
    [[nodiscard]] std::shared_ptr<FakeChannel> last_channel() const { return inner_.last_channel(); }

  private:
    std::promise<void> promise_;
    std::shared_future<void> gate_{promise_.get_future().share()};
    std::atomic<bool> entered_{false};
    ScriptedTransport inner_;
};

} // namespace

class ConnectionHandlerTest : public ::testing::Test
{
  protected:
    TempDir dir_{"agentgate_handler"};
    std::shared_ptr<WorkerRegistry> registry_ =
        std::make_shared<WorkerRegistry>(std::vector<std::string>{"agent-1"});
    std::shared_ptr<StaticSecretStore> secrets_ = std::make_shared<StaticSecretStore>("s3cr3t");
    std::shared_ptr<FileAgentLogSink> log_sink_ =
        std::make_shared<FileAgentLogSink>(dir_ / "agents");
    std::shared_ptr<ScriptedTransport> transport_ = std::make_shared<ScriptedTransport>();

    ConnectionServices services(std::shared_ptr<ChannelTransport> transport = nullptr) const
    {
        ConnectionServices s;
        s.registry = registry_;
        s.secrets = secrets_;
        s.log_sink = log_sink_;
        s.transport = transport ? std::move(transport) : transport_;
        return s;
    }

    std::string agent_log(const std::string &name) const
    {
        return read_file(log_sink_->path_for(name));
    }

    /// Full client side of one handshake; returns the controller's reply line.
    std::optional<std::string> handshake(const SocketPtr &client_socket, const std::string &secret,
                                         const std::string &name)
    {
        AgentClient client(client_socket);
        client.send_secret(secret);
        client.send_name(name);
        return client.read_line();
    }
};

// ============================================================================
// Success
// ============================================================================

TEST_F(ConnectionHandlerTest, CorrectSecretAndKnownNameIsWelcomed)
{
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());

    EXPECT_EQ(handshake(client, "s3cr3t", "agent-1"), std::optional<std::string>("Welcome"));

    HandshakeOutcome out = fut.get();
    ASSERT_EQ(out.error, nullptr);
    ASSERT_TRUE(out.result.is_ok());

    ChannelPtr channel = out.result.content();
    ASSERT_NE(channel, nullptr);
    EXPECT_EQ(channel->name(), "agent-1");
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel(), channel);
    EXPECT_FALSE(registry_->lookup("agent-1")->is_reserved());
    EXPECT_EQ(transport_->establish_calls(), 1);
    EXPECT_FALSE(server->is_closed()) << "the channel owns the socket now";
    EXPECT_THAT(agent_log("agent-1"), HasSubstr("Agent connected from test-peer"));
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(ConnectionHandlerTest, WrongSecretIsUnauthorized)
{
    LogCapture logs;
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());

    AgentClient agent(client);
    agent.send_secret("wrong");
    EXPECT_EQ(agent.read_line(), std::optional<std::string>("Unauthorized access"));
    EXPECT_TRUE(agent.at_eof());

    HandshakeOutcome out = fut.get();
    ASSERT_EQ(out.error, nullptr);
    ASSERT_TRUE(out.result.is_error());
    EXPECT_EQ(out.result.error(), HandshakeRejection::Unauthorized);

    EXPECT_TRUE(server->is_closed());
    EXPECT_EQ(transport_->establish_calls(), 0);
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel(), nullptr);
    EXPECT_FALSE(registry_->lookup("agent-1")->is_reserved());
    EXPECT_FALSE(fs::exists(log_sink_->path_for("agent-1")));
    EXPECT_EQ(logs.count("test-context is aborted: Unauthorized access"), 1u);
}

TEST_F(ConnectionHandlerTest, SecretComparisonIsExact)
{
    const std::vector<std::string> candidates{"s3cr3t ", "S3CR3T", "s3cr3", ""};
    for (const std::string &candidate : candidates)
    {
        auto [server, client] = make_socket_pair();
        auto fut = start_handler(server, services());
        AgentClient agent(client);
        agent.send_secret(candidate);
        EXPECT_EQ(agent.read_line(), std::optional<std::string>("Unauthorized access"))
            << "candidate '" << candidate << "'";
        HandshakeOutcome out = fut.get();
        ASSERT_TRUE(out.result.is_error());
        EXPECT_EQ(out.result.error(), HandshakeRejection::Unauthorized);
    }
    EXPECT_EQ(transport_->establish_calls(), 0);
}

TEST_F(ConnectionHandlerTest, UnknownNameIsRejectedWithExactName)
{
    LogCapture logs;
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());

    EXPECT_EQ(handshake(client, "s3cr3t", "agent-2"),
              std::optional<std::string>("No such slave: agent-2"));

    HandshakeOutcome out = fut.get();
    ASSERT_EQ(out.error, nullptr);
    ASSERT_TRUE(out.result.is_error());
    EXPECT_EQ(out.result.error(), HandshakeRejection::UnknownAgent);
    EXPECT_TRUE(server->is_closed());

    EXPECT_EQ(registry_->lookup("agent-2"), nullptr);
    EXPECT_EQ(registry_->names(), std::vector<std::string>{"agent-1"});
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel(), nullptr);
    EXPECT_EQ(transport_->establish_calls(), 0);
    EXPECT_EQ(logs.count("test-context is aborted: No such slave: agent-2"), 1u);
}

TEST_F(ConnectionHandlerTest, UnknownNameWithUtf8IsEchoedVerbatim)
{
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());

    const std::string name = "agent-\xc3\xa9\xe2\x82\xac";
    EXPECT_EQ(handshake(client, "s3cr3t", name), std::optional<std::string>("No such slave: " + name));
    HandshakeOutcome out = fut.get();
    ASSERT_TRUE(out.result.is_error());
    EXPECT_EQ(out.result.error(), HandshakeRejection::UnknownAgent);
}

TEST_F(ConnectionHandlerTest, SecondHandshakeForConnectedAgentIsRejected)
{
    auto [server1, client1] = make_socket_pair();
    auto fut1 = start_handler(server1, services());
    ASSERT_EQ(handshake(client1, "s3cr3t", "agent-1"), std::optional<std::string>("Welcome"));
    HandshakeOutcome first = fut1.get();
    ASSERT_TRUE(first.result.is_ok());
    ChannelPtr original = first.result.content();
    auto original_fake = transport_->last_channel();

    LogCapture logs;
    auto [server2, client2] = make_socket_pair();
    auto fut2 = start_handler(server2, services());
    EXPECT_EQ(handshake(client2, "s3cr3t", "agent-1"),
              std::optional<std::string>(
                  "agent-1 is already connected to this master. Rejecting this connection."));

    HandshakeOutcome second = fut2.get();
    ASSERT_EQ(second.error, nullptr);
    ASSERT_TRUE(second.result.is_error());
    EXPECT_EQ(second.result.error(), HandshakeRejection::AlreadyConnected);
    EXPECT_TRUE(server2->is_closed());

    // The first connection is untouched.
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel().get(), original.get());
    EXPECT_FALSE(original->is_closed());
    EXPECT_EQ(original_fake->close_calls(), 0);
    EXPECT_FALSE(server1->is_closed());
    EXPECT_EQ(transport_->establish_calls(), 1);
    EXPECT_EQ(logs.count("test-context is aborted: agent-1 is already connected"), 1u);
}

TEST_F(ConnectionHandlerTest, HandshakeInFlightBlocksSecondHandshake)
{
    auto blocking = std::make_shared<BlockingTransport>();

    auto [server1, client1] = make_socket_pair();
    auto fut1 = start_handler(server1, services(blocking));
    AgentClient agent1(client1);
    agent1.send_secret("s3cr3t");
    agent1.send_name("agent-1");
    ASSERT_EQ(agent1.read_line(), std::optional<std::string>("Welcome"));
    ASSERT_TRUE(wait_until([&]() { return blocking->entered(); }));
    EXPECT_TRUE(registry_->lookup("agent-1")->is_reserved());
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel(), nullptr);

    auto [server2, client2] = make_socket_pair();
    auto fut2 = start_handler(server2, services(blocking));
    EXPECT_EQ(handshake(client2, "s3cr3t", "agent-1"),
              std::optional<std::string>(
                  "agent-1 is already connected to this master. Rejecting this connection."));
    HandshakeOutcome second = fut2.get();
    ASSERT_TRUE(second.result.is_error());
    EXPECT_EQ(second.result.error(), HandshakeRejection::AlreadyConnected);

    blocking->release();
    HandshakeOutcome first = fut1.get();
    ASSERT_EQ(first.error, nullptr);
    ASSERT_TRUE(first.result.is_ok());
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel(), first.result.content());
}

TEST_F(ConnectionHandlerTest, InterruptDuringEstablishmentDiscardsChannel)
{
    auto blocking = std::make_shared<BlockingTransport>();
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services(blocking));

    AgentClient agent(client);
    agent.send_secret("s3cr3t");
    agent.send_name("agent-1");
    ASSERT_EQ(agent.read_line(), std::optional<std::string>("Welcome"));
    ASSERT_TRUE(wait_until([&]() { return blocking->entered(); }));

    // The listener is stopping: it wins the socket before the handler does.
    EXPECT_TRUE(server->interrupt_handshake());
    blocking->release();

    HandshakeOutcome out = fut.get();
    ASSERT_NE(out.error, nullptr);
    try
    {
        std::rethrow_exception(out.error);
    }
    catch (const IoError &e)
    {
        EXPECT_EQ(e.code(), std::errc::operation_canceled);
    }
    ASSERT_NE(blocking->last_channel(), nullptr);
    EXPECT_EQ(blocking->last_channel()->close_calls(), 1);
    EXPECT_FALSE(registry_->lookup("agent-1")->is_reserved());
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel(), nullptr);
    EXPECT_TRUE(server->is_closed());
}

TEST_F(ConnectionHandlerTest, SuccessfulHandshakeOwnsTheSocket)
{
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());
    EXPECT_EQ(handshake(client, "s3cr3t", "agent-1"), std::optional<std::string>("Welcome"));
    ASSERT_TRUE(fut.get().result.is_ok());

    EXPECT_FALSE(server->interrupt_handshake());
    EXPECT_FALSE(server->is_closed());
}

TEST_F(ConnectionHandlerTest, ConcurrentHandshakesAdmitExactlyOne)
{
    constexpr int kAttempts = 16;
    std::vector<SocketPtr> servers;
    std::vector<SocketPtr> clients;
    std::vector<std::future<HandshakeOutcome>> futures;
    for (int i = 0; i < kAttempts; ++i)
    {
        auto [server, client] = make_socket_pair();
        servers.push_back(server);
        clients.push_back(client);
    }
    // Queue every handshake before any handler starts so they race on the slot.
    for (auto &client : clients)
    {
        AgentClient agent(client);
        agent.send_secret("s3cr3t");
        agent.send_name("agent-1");
    }
    for (auto &server : servers)
    {
        futures.push_back(start_handler(server, services()));
    }

    int admitted = 0;
    int duplicates = 0;
    for (auto &f : futures)
    {
        HandshakeOutcome out = f.get();
        ASSERT_EQ(out.error, nullptr);
        if (out.result.is_ok())
            ++admitted;
        else if (out.result.error() == HandshakeRejection::AlreadyConnected)
            ++duplicates;
    }
    EXPECT_EQ(admitted, 1);
    EXPECT_EQ(duplicates, kAttempts - 1);
    EXPECT_EQ(transport_->establish_calls(), 1);

    int welcomed = 0;
    for (auto &client : clients)
    {
        AgentClient agent(client);
        auto line = agent.read_line();
        ASSERT_TRUE(line.has_value());
        if (*line == "Welcome")
            ++welcomed;
    }
    EXPECT_EQ(welcomed, 1);
}

TEST_F(ConnectionHandlerTest, RejectionStillClosesWhenPeerIsGone)
{
    auto [server, client] = make_socket_pair();
    {
        AgentClient agent(client);
        agent.send_secret("wrong");
    }
    client->close();

    auto fut = start_handler(server, services());
    HandshakeOutcome out = fut.get();
    ASSERT_EQ(out.error, nullptr);
    ASSERT_TRUE(out.result.is_error());
    EXPECT_EQ(out.result.error(), HandshakeRejection::Unauthorized);
    EXPECT_TRUE(server->is_closed());
}

// ============================================================================
// Handshake I/O failures
// ============================================================================

TEST_F(ConnectionHandlerTest, EndOfStreamDuringHandshakeThrowsIoError)
{
    auto [server, client] = make_socket_pair();
    {
        AgentClient agent(client);
        agent.send_secret("s3cr3t");
    }
    client->close();

    HandshakeOutcome out = start_handler(server, services()).get();
    ASSERT_NE(out.error, nullptr);
    EXPECT_THROW(std::rethrow_exception(out.error), IoError);
    EXPECT_TRUE(server->is_closed());
    EXPECT_FALSE(registry_->lookup("agent-1")->is_reserved());
}

TEST_F(ConnectionHandlerTest, MalformedUtf8NameThrowsIoError)
{
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());
    AgentClient agent(client);
    agent.send_secret("s3cr3t");
    agent.send_name("agent-\xc0\xaf");

    HandshakeOutcome out = fut.get();
    ASSERT_NE(out.error, nullptr);
    try
    {
        std::rethrow_exception(out.error);
    }
    catch (const IoError &e)
    {
        EXPECT_EQ(e.code(), std::errc::illegal_byte_sequence);
    }
    EXPECT_TRUE(server->is_closed());
    EXPECT_EQ(transport_->establish_calls(), 0);
}

TEST_F(ConnectionHandlerTest, ReadDeadlineAbortsSilentPeer)
{
    ConnectionServices s = services();
    s.read_timeout = std::chrono::milliseconds(100);

    auto [server, client] = make_socket_pair();
    const auto started = std::chrono::steady_clock::now();
    HandshakeOutcome out = start_handler(server, s).get();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_NE(out.error, nullptr);
    try
    {
        std::rethrow_exception(out.error);
    }
    catch (const IoError &e)
    {
        EXPECT_EQ(e.code(), std::errc::timed_out);
    }
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_TRUE(server->is_closed());
}

// ============================================================================
// Channel establishment failures
// ============================================================================

TEST_F(ConnectionHandlerTest, TransportIoErrorIsLoggedWithTraceAndPropagated)
{
    transport_->set_outcome(ScriptedTransport::Outcome::ThrowIoError);
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());

    AgentClient agent(client);
    agent.send_secret("s3cr3t");
    agent.send_name("agent-1");
    EXPECT_EQ(agent.read_line(), std::optional<std::string>("Welcome"));

    HandshakeOutcome out = fut.get();
    ASSERT_NE(out.error, nullptr);
    EXPECT_THROW(std::rethrow_exception(out.error), IoError);
    EXPECT_TRUE(server->is_closed());
    EXPECT_TRUE(agent.at_eof());

    const std::string log = agent_log("agent-1");
    EXPECT_THAT(log, HasSubstr("Agent connected from test-peer"));
    EXPECT_THAT(log, HasSubstr("Failed to establish the connection with the agent agent-1"));
    EXPECT_THAT(log, HasSubstr("IoError: channel preamble"));
    EXPECT_THAT(log, HasSubstr("Caused by: IoError: recv: simulated reset"));

    auto slot = registry_->lookup("agent-1");
    EXPECT_EQ(slot->current_channel(), nullptr);
    EXPECT_FALSE(slot->is_reserved());
}

TEST_F(ConnectionHandlerTest, TransportAbortIsLoggedAndPropagated)
{
    transport_->set_outcome(ScriptedTransport::Outcome::ThrowAbortError);
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());

    EXPECT_EQ(handshake(client, "s3cr3t", "agent-1"), std::optional<std::string>("Welcome"));

    HandshakeOutcome out = fut.get();
    ASSERT_NE(out.error, nullptr);
    EXPECT_THROW(std::rethrow_exception(out.error), AbortError);
    EXPECT_TRUE(server->is_closed());

    const std::string log = agent_log("agent-1");
    EXPECT_THAT(log, HasSubstr("Peer did not send a channel preamble"));
    EXPECT_THAT(log, HasSubstr("Failed to establish the connection with the agent\n"));
    EXPECT_FALSE(registry_->lookup("agent-1")->is_reserved());
}

TEST_F(ConnectionHandlerTest, NameIsEligibleAgainAfterFailedEstablishment)
{
    transport_->set_outcome(ScriptedTransport::Outcome::ThrowIoError);
    {
        auto [server, client] = make_socket_pair();
        auto fut = start_handler(server, services());
        ASSERT_EQ(handshake(client, "s3cr3t", "agent-1"), std::optional<std::string>("Welcome"));
        ASSERT_NE(fut.get().error, nullptr);
    }

    transport_->set_outcome(ScriptedTransport::Outcome::Succeed);
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());
    EXPECT_EQ(handshake(client, "s3cr3t", "agent-1"), std::optional<std::string>("Welcome"));
    EXPECT_TRUE(fut.get().result.is_ok());
    EXPECT_NE(registry_->lookup("agent-1")->current_channel(), nullptr);
}

TEST_F(ConnectionHandlerTest, ChannelClosedBeforeRegistrationLeavesSlotOffline)
{
    transport_->set_outcome(ScriptedTransport::Outcome::SucceedThenCloseImmediately);
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());
    EXPECT_EQ(handshake(client, "s3cr3t", "agent-1"), std::optional<std::string>("Welcome"));

    HandshakeOutcome out = fut.get();
    ASSERT_TRUE(out.result.is_ok());
    EXPECT_TRUE(out.result.content()->is_closed());
    auto slot = registry_->lookup("agent-1");
    EXPECT_EQ(slot->current_channel(), nullptr);
    EXPECT_FALSE(slot->is_reserved());
    EXPECT_TRUE(server->is_closed());
}

// ============================================================================
// Close callback
// ============================================================================

TEST_F(ConnectionHandlerTest, CloseCallbackReturnsSlotToOffline)
{
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());
    ASSERT_EQ(handshake(client, "s3cr3t", "agent-1"), std::optional<std::string>("Welcome"));
    ASSERT_TRUE(fut.get().result.is_ok());

    LogCapture logs;
    ASSERT_TRUE(transport_->fire_close(nullptr));
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel(), nullptr);
    EXPECT_TRUE(server->is_closed());
    EXPECT_EQ(logs.count("terminated"), 0u) << "orderly close must not warn";

    // A second termination report is impossible: the callback was handed out once.
    EXPECT_FALSE(transport_->fire_close(nullptr));

    auto [server2, client2] = make_socket_pair();
    auto fut2 = start_handler(server2, services());
    EXPECT_EQ(handshake(client2, "s3cr3t", "agent-1"), std::optional<std::string>("Welcome"));
    HandshakeOutcome again = fut2.get();
    ASSERT_TRUE(again.result.is_ok());
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel(), again.result.content());
}

TEST_F(ConnectionHandlerTest, CloseCallbackWithCauseWarns)
{
    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services());
    ASSERT_EQ(handshake(client, "s3cr3t", "agent-1"), std::optional<std::string>("Welcome"));
    ASSERT_TRUE(fut.get().result.is_ok());

    LogCapture logs;
    auto cause = std::make_exception_ptr(
        IoError(std::make_error_code(std::errc::connection_reset), "recv"));
    ASSERT_TRUE(transport_->fire_close(cause));

    EXPECT_EQ(logs.count("test-context for agent-1 terminated"), 1u);
    EXPECT_THAT(logs.contents(), HasSubstr("IoError: recv"));
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel(), nullptr);
    EXPECT_TRUE(server->is_closed());
}

// ============================================================================
// End to end with the stream transport
// ============================================================================

TEST_F(ConnectionHandlerTest, WelcomePrecedesChannelTrafficAndDisconnectFreesSlot)
{
    std::mutex mu;
    std::vector<std::string> received;
    auto stream_transport = std::make_shared<StreamChannelTransport>(
        [&](Channel &, const std::string &payload)
        {
            std::lock_guard<std::mutex> lock(mu);
            received.push_back(payload);
        });

    auto [server, client] = make_socket_pair();
    auto fut = start_handler(server, services(stream_transport));

    AgentClient agent(client);
    agent.send_secret("s3cr3t");
    agent.send_name("agent-1");
    ASSERT_EQ(agent.read_line(), std::optional<std::string>("Welcome"));
    ASSERT_EQ(agent.exchange_preamble(kChannelPreamble), std::string(kChannelPreamble));

    HandshakeOutcome out = fut.get();
    ASSERT_EQ(out.error, nullptr);
    ASSERT_TRUE(out.result.is_ok());
    ChannelPtr channel = out.result.content();
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel(), channel);

    agent.send_frame("hello controller");
    ASSERT_TRUE(wait_until(
        [&]()
        {
            std::lock_guard<std::mutex> lock(mu);
            return !received.empty();
        }));
    {
        std::lock_guard<std::mutex> lock(mu);
        EXPECT_EQ(received.front(), "hello controller");
    }

    channel->send("hello agent");
    EXPECT_EQ(agent.read_frame(), std::optional<std::string>("hello agent"));

    agent.close();
    ASSERT_TRUE(channel->wait_closed(std::chrono::seconds(5)));
    EXPECT_TRUE(channel->is_closed());
    EXPECT_EQ(registry_->lookup("agent-1")->current_channel(), nullptr);
    EXPECT_TRUE(server->is_closed());
    EXPECT_THAT(agent_log("agent-1"), HasSubstr("Connection terminated"));
}
