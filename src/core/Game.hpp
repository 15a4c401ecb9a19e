//
// Game.hpp
//

#ifndef SETRUSH_GAME_HPP
#define SETRUSH_GAME_HPP

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "Dealer.hpp"
#include "Display.hpp"
#include "Exception.hpp"
#include "SetOracle.hpp"
#include "Table.hpp"
#include "Types.hpp"

namespace setrush::core::debug {class AuditLogger;}
namespace setrush::core
{
    // Wires the table, the players (humans first, then computers) and the dealer, and owns
    // the dealer thread.
    class Game
    {
    public:
        Game() = delete;
        // a null oracle means the feature oracle built from the config
        Game(Config const& config, std::shared_ptr<Display> display, std::unique_ptr<SetOracle> oracle = nullptr);
        ~Game();

        Game(Game const&) = delete;
        auto operator=(Game const&) -> Game& = delete;

        auto SetAuditLogger(std::shared_ptr<debug::AuditLogger> audit) -> void;

        auto Start() -> void;
        // asks every actor to stop; does not block
        auto Stop() -> void;
        // joins the dealer thread and rethrows whatever ended it abnormally
        auto Wait() -> void;

        // input entry point for external key presses
        auto KeyPressed(PlyrIdxT player, SlotIdxT slot) -> error::KeyAccept;

        auto Finished() const noexcept -> bool { return finished_.load(); }
        auto Scores() const -> std::vector<int>;
        auto Winners() const -> std::vector<PlyrIdxT>;
        auto Configuration() const noexcept -> Config const& { return cfg_; }
        auto GetTable() const noexcept -> Table const& { return *table_; }
        auto GetDealer() noexcept -> Dealer& { return *dealer_; }

    private:
        Config cfg_;
        std::shared_ptr<Display> display_;
        std::shared_ptr<Table> table_;
        std::unique_ptr<Dealer> dealer_;

        std::thread dealer_thread_;
        std::mutex failure_m_;
        std::exception_ptr failure_;
        std::atomic<bool> finished_{false};
    };
}
#endif //SETRUSH_GAME_HPP
