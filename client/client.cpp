#include "client.hpp"
#include "core/fairness.hpp"
#include "packets/round.hpp"
#include "packets/session.hpp"
#include "precompiled.hpp"

namespace house
{
    namespace
    {
        constexpr auto kKeepAliveInterval = std::chrono::seconds(5);
    } // namespace

    Client::Client(std::string_view const address, uint32_t const port, std::string_view const player_id)
        : m_connection(m_io_context, address, port), m_player_id(player_id), m_running(false)
    {
    }

    Client::~Client()
    {
        m_running = false;
        if (m_keep_alive.joinable())
        {
            m_keep_alive.join();
        }
    }

    auto Client::keep_alive() -> void
    {
        auto next = std::chrono::steady_clock::now() + kKeepAliveInterval;
        while (m_running)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (std::chrono::steady_clock::now() < next)
            {
                continue;
            }
            next += kKeepAliveInterval;

            try
            {
                m_connection.write(core::MessageType::Ping, nlohmann::json::object());
            }
            catch (boost::system::system_error const&)
            {
                return;
            }
        }
    }

    auto Client::run() -> void
    {
        bool welcomed = false;
        {
            auto packet = std::make_unique<packets::HelloPacket>(m_player_id, welcomed);
            if (!packet->process(m_connection))
            {
                std::cout << "\n" << packet->error().value_or("Unknown response from server") << "\n" << std::endl;
                return;
            }
            if (packet->error())
            {
                std::cout << "\n" << packet->error().value() << "\n" << std::endl;
                return;
            }
        }
        if (!welcomed)
        {
            std::cout << "\nThe server did not accept the identity\n" << std::endl;
            return;
        }
        std::cout << "\nWelcome, " << m_player_id << "!\n" << std::endl;

        m_running = true;
        m_keep_alive = std::thread([this]() { this->keep_alive(); });

        bool running = true;
        while (running)
        {
            std::cout << "Menu:\n"
                         "1) Balance\n"
                         "2) Deposit\n"
                         "3) Flip a coin\n"
                         "4) Settlement of last round\n"
                         "5) Vault\n"
                         "6) Exit\n"
                      << std::endl;

            uint16_t menu_option;
            std::cout << "Select: ";
            if (!(std::cin >> menu_option))
            {
                break;
            }

            switch (menu_option)
            {
                case 1: {
                    packets::BalanceInfo balance_info{};
                    auto packet = std::make_unique<packets::BalancePacket>(balance_info);
                    if (!packet->process(m_connection) || packet->error())
                    {
                        std::cout << "\n" << packet->error().value_or("Unknown response from server") << "\n"
                                  << std::endl;
                        break;
                    }
                    std::cout << std::format("\n{:10} {:>12}\n{:10} {:>12}\n", "Available", balance_info.available,
                                             "Reserved", balance_info.reserved)
                              << std::endl;
                    break;
                }

                case 2: {
                    uint64_t amount;
                    std::cout << "Type amount: ";
                    std::cin >> amount;

                    packets::BalanceInfo balance_info{};
                    auto packet = std::make_unique<packets::DepositPacket>(amount, balance_info);
                    if (!packet->process(m_connection) || packet->error())
                    {
                        std::cout << "\n" << packet->error().value_or("Unknown response from server") << "\n"
                                  << std::endl;
                        break;
                    }
                    std::cout << std::format("\nAvailable: {}\n", balance_info.available) << std::endl;
                    break;
                }

                case 3: {
                    this->play();
                    break;
                }

                case 4: {
                    if (m_last_round_id.empty())
                    {
                        std::cout << "\nNo round played yet\n" << std::endl;
                        break;
                    }

                    std::string status;
                    auto packet = std::make_unique<packets::SettlementStatusPacket>(m_last_round_id, status);
                    if (!packet->process(m_connection) || packet->error())
                    {
                        std::cout << "\n" << packet->error().value_or("Unknown response from server") << "\n"
                                  << std::endl;
                        break;
                    }
                    std::cout << std::format("\nRound {}: {}\n", m_last_round_id, status) << std::endl;
                    break;
                }

                case 5: {
                    nlohmann::json snapshot;
                    auto packet = std::make_unique<packets::VaultPacket>(snapshot);
                    if (!packet->process(m_connection) || packet->error())
                    {
                        std::cout << "\n" << packet->error().value_or("Unknown response from server") << "\n"
                                  << std::endl;
                        break;
                    }
                    std::cout << std::format("\nShare price: {}{}\nTotal assets: {}\nTotal shares: {}\n",
                                             snapshot.at("sharePrice").get<std::string>(),
                                             snapshot.at("isStale").get<bool>() ? " (stale)" : "",
                                             snapshot.at("totalAssets").get<std::string>(),
                                             snapshot.at("totalShares").get<std::string>())
                              << std::endl;
                    break;
                }

                case 6: {
                    running = false;
                    break;
                }

                default: {
                    std::cout << "\nUnknown menu option\n" << std::endl;
                    break;
                }
            }

            if (!m_connection.is_open())
            {
                std::cout << "Disconnected from server\n" << std::endl;
                running = false;
            }
        }
    }

    auto Client::play() -> void
    {
        uint64_t wager;
        std::cout << "Type wager: ";
        std::cin >> wager;

        std::string choice_name;
        std::optional<core::CoinChoice> choice;
        while (!choice)
        {
            std::cout << "Type 'heads' or 'tails': ";
            std::cin >> choice_name;
            choice = core::parse_choice(choice_name);
        }

        auto const nonce = core::generate_nonce();
        auto const commitment = core::create_commitment(wager, choice.value(), nonce);

        packets::CommittedInfo committed_info;
        {
            auto packet = std::make_unique<packets::SubmitCommitmentPacket>(wager, choice.value(), commitment,
                                                                            committed_info);
            if (!packet->process(m_connection) || packet->error())
            {
                std::cout << "\n" << packet->error().value_or("Unknown response from server") << "\n" << std::endl;
                return;
            }
        }
        m_last_round_id = committed_info.round_id;
        std::cout << std::format("\nRound {} opened, house commitment {}\n", committed_info.round_id,
                                 committed_info.house_commitment)
                  << std::endl;

        packets::ResolvedInfo resolved_info;
        {
            auto packet = std::make_unique<packets::RevealPacket>(nonce, resolved_info);
            if (!packet->process(m_connection) || packet->error())
            {
                std::cout << "\n" << packet->error().value_or("Unknown response from server") << "\n" << std::endl;
                return;
            }
        }
        if (resolved_info.voided)
        {
            std::cout << "\nRound was voided by the server\n" << std::endl;
            return;
        }

        bool const house_nonce_matches =
            core::verify_house_commitment(committed_info.house_commitment, resolved_info.house_nonce);
        bool const outcome_matches = house_nonce_matches && core::is_hex32(resolved_info.house_nonce) &&
                                     core::derive_result(nonce, resolved_info.house_nonce) == resolved_info.outcome;
        bool const payout_bounded = resolved_info.payout <= core::calculate_payout(wager, resolved_info.won, 0);

        std::cout << std::format("\nOutcome: {}, {}! Payout: {}\n", core::to_string(resolved_info.outcome),
                                 resolved_info.won ? "you won" : "you lost", resolved_info.payout);
        if (house_nonce_matches && outcome_matches && payout_bounded)
        {
            std::cout << "Fairness verified: house nonce opens its commitment and derives this outcome\n"
                      << std::endl;
        }
        else
        {
            std::cout << "WARNING: fairness check failed for this round\n" << std::endl;
        }
    }
} // namespace house
