//
// Game.cpp
//
#include "Game.hpp"

#include <print>
#include <utility>
#include "Config.hpp"
#include "FeatureOracle.hpp"
#include "Player.hpp"
#include "Util.hpp"

namespace setrush::core
{
    Game::Game(Config const& config, std::shared_ptr<Display> display, std::unique_ptr<SetOracle> oracle) :
        cfg_(config),
        display_(std::move(display))
    {
        Validate(cfg_);
        SR_ASSERT(display_ != nullptr, "Game requires a display sink");
        if (!oracle) oracle = std::make_unique<FeatureOracle>(cfg_);

        table_ = std::make_shared<Table>(cfg_, display_);

        std::vector<std::unique_ptr<Player>> players;
        players.reserve(cfg_.PlayerCount());
        for (size_t i{}; i < cfg_.PlayerCount(); ++i)
        {
            bool const human = IsHumanSeat(cfg_, i);
            players.push_back(std::make_unique<Player>(cfg_, static_cast<PlyrIdxT>(i), human, table_, display_));
        }

        dealer_ = std::make_unique<Dealer>(cfg_, table_, display_, std::move(oracle), std::move(players));
    }

    Game::~Game()
    {
        Stop();
        if (dealer_thread_.joinable()) dealer_thread_.join();
    }

    auto Game::SetAuditLogger(std::shared_ptr<debug::AuditLogger> audit) -> void
    {
        SR_ASSERT(!dealer_thread_.joinable(), "Audit logger must be attached before the game starts");
        dealer_->SetAuditLogger(std::move(audit));
    }

    auto Game::Start() -> void
    {
        SR_ASSERT(!dealer_thread_.joinable(), "Game started twice");
        dealer_thread_ = std::thread([this]
        {
            try
            {
                dealer_->Run();
            }
            catch (OmegaException<error::Code> const& e)
            {
                std::print(stderr, "[setrush] dealer stopped: {}\n", e.what());
                std::lock_guard<std::mutex> lock(failure_m_);
                failure_ = std::current_exception();
            }
            catch (std::exception const& e)
            {
                std::print(stderr, "[setrush] dealer stopped: {}\n", e.what());
                std::lock_guard<std::mutex> lock(failure_m_);
                failure_ = std::current_exception();
            }
            catch (...)
            {
                std::lock_guard<std::mutex> lock(failure_m_);
                failure_ = std::current_exception();
            }
            finished_ = true;
        });
    }

    auto Game::Stop() -> void
    {
        dealer_->Terminate();
    }

    auto Game::Wait() -> void
    {
        if (dealer_thread_.joinable()) dealer_thread_.join();

        std::exception_ptr failure;
        {
            std::lock_guard<std::mutex> lock(failure_m_);
            failure = std::exchange(failure_, nullptr);
        }
        if (failure) std::rethrow_exception(failure);
    }

    auto Game::KeyPressed(PlyrIdxT const player, SlotIdxT const slot) -> error::KeyAccept
    {
        if (player >= dealer_->PlayerCount())
        {
            return error::Reject(error::InputRejection{.code = error::RejectionCode::Input_UnknownPlayer}
                                     .with_player(player).with_slot(slot));
        }
        return dealer_->PlayerAt(player).KeyPressed(slot);
    }

    auto Game::Scores() const -> std::vector<int>
    {
        return dealer_->Scores();
    }

    auto Game::Winners() const -> std::vector<PlyrIdxT>
    {
        return dealer_->Winners();
    }
}
