#include "core/logging.hpp"
#include "gateway.hpp"
#include "helpers.hpp"
#include "precompiled.hpp"
#include "session.hpp"
#include <gtest/gtest.h>

using namespace house;

namespace
{
    auto make_line(core::MessageType const message_type, nlohmann::json payload) -> std::string
    {
        nlohmann::json packet;
        packet["type"] = message_type;
        packet["payload"] = std::move(payload);
        return packet.dump() + '\n';
    }

    // Everything the server wrote before closing, one envelope per line.
    auto read_until_closed(boost::asio::ip::tcp::socket& socket) -> std::vector<nlohmann::json>
    {
        boost::asio::streambuf buffer;
        boost::system::error_code error;
        boost::asio::read(socket, buffer, error);
        EXPECT_EQ(error, boost::asio::error::eof);

        std::vector<nlohmann::json> packets;
        std::istream stream(&buffer);
        std::string line;
        while (std::getline(stream, line))
        {
            if (!line.empty())
            {
                packets.emplace_back(nlohmann::json::parse(line));
            }
        }
        return packets;
    }
} // namespace

TEST(Session, SilentConnectionIsClosed_Test)
{
    boost::asio::io_context io_context;

    auto test_db = fixtures::memory_database();
    modules::Wallet wallet(test_db, std::nullopt);
    modules::Rounds rounds(test_db, std::nullopt);
    modules::SettlementPipeline pipeline(io_context, test_db, wallet, rounds, nullptr, modules::RetryPolicy{},
                                         std::chrono::seconds(5), std::nullopt);
    ASSERT_TRUE(pipeline.seed_pool(1000000000));
    PlayerRegistry registry;
    Gateway gateway(wallet, rounds, pipeline, nullptr, registry, GatewaySettings{}, std::nullopt);

    boost::asio::ip::tcp::acceptor acceptor(
        io_context, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    boost::asio::ip::tcp::socket client(io_context);
    client.connect(acceptor.local_endpoint());
    auto server_socket = acceptor.accept();

    auto session = std::make_shared<Session>(
        std::move(server_socket), 1,
        SessionSettings{.heartbeat_interval = std::chrono::milliseconds(40),
                        .heartbeat_timeout = std::chrono::milliseconds(40)},
        core::create_logger("session", std::nullopt));

    bool closed = false;
    session->on_message = [&gateway](PlayerContext& context, std::string_view const line) -> Response {
        return gateway.on_message(context, line, modules::Clock::now());
    };
    session->on_tick = [&gateway](PlayerContext& context) -> std::vector<Response> {
        return gateway.on_tick(context, modules::Clock::now());
    };
    session->on_closed = [&gateway, &closed](PlayerContext& context) {
        gateway.on_closed(context, modules::Clock::now());
        closed = true;
    };

    auto const nonce = core::generate_nonce();
    auto const requests =
        make_line(core::MessageType::Hello, {{"playerId", "alice"}}) +
        make_line(core::MessageType::Deposit, {{"amount", 5000}}) +
        make_line(core::MessageType::SubmitCommitment,
                  {{"wager", 1000},
                   {"choice", "heads"},
                   {"commitment", core::create_commitment(1000, core::CoinChoice::Heads, nonce)}});
    boost::asio::write(client, boost::asio::buffer(requests));

    // The player never answers the heartbeat
    session->start();
    io_context.run_for(std::chrono::milliseconds(500));
    ASSERT_TRUE(closed);
    ASSERT_EQ(registry.size(), 0u);

    auto const packets = read_until_closed(client);
    ASSERT_GE(packets.size(), 4u);
    ASSERT_EQ(packets[0].at("type").get<core::MessageType>(), core::MessageType::Welcome);
    ASSERT_EQ(packets[1].at("type").get<core::MessageType>(), core::MessageType::Balance);
    ASSERT_EQ(packets[2].at("type").get<core::MessageType>(), core::MessageType::Committed);
    ASSERT_TRUE(std::ranges::any_of(packets, [](nlohmann::json const& packet) {
        return packet.at("type").get<core::MessageType>() == core::MessageType::Heartbeat;
    }));

    auto const round_id = packets[2].at("payload").at("roundId").get<std::string>();
    ASSERT_EQ(rounds.find(round_id).value().state, modules::RoundState::Expired);

    auto const balance_info = wallet.balance("alice").value();
    ASSERT_EQ(balance_info.available, 5000u);
    ASSERT_EQ(balance_info.reserved, 0u);
}

TEST(Session, OversizedLineClosesConnection_Test)
{
    boost::asio::io_context io_context;

    boost::asio::ip::tcp::acceptor acceptor(
        io_context, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    boost::asio::ip::tcp::socket client(io_context);
    client.connect(acceptor.local_endpoint());

    auto session = std::make_shared<Session>(acceptor.accept(), 2, SessionSettings{.max_line_length = 64},
                                             core::create_logger("session", std::nullopt));
    size_t messages = 0;
    bool closed = false;
    session->on_message = [&messages](PlayerContext&, std::string_view const) -> Response {
        ++messages;
        return Response(core::MessageType::Pong, std::nullopt);
    };
    session->on_closed = [&closed](PlayerContext&) { closed = true; };

    boost::asio::write(client, boost::asio::buffer(std::string(256, 'x')));

    session->start();
    io_context.run_for(std::chrono::milliseconds(200));
    ASSERT_TRUE(closed);
    ASSERT_EQ(messages, 0u);
}
