#pragma once

#include "Board.hpp"
#include "Ruleset.hpp"
#include "Types.hpp"
#include "engine/Clock.hpp"
#include "engine/EngineParts.hpp"
#include "engine/Presets.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace modtris::core {

struct GameOptions {
    RuleOverrides ruleOverrides;  // applied last, always win
    std::optional<Board> board;   // shared, not copied; twice the visible height
    std::vector<PieceType> queue; // pieces to serve before the randomizer's
    std::optional<int> level;     // starting level, defaults to "initial_level"
    std::uint64_t score{0};
    RuleValue seed;               // shorthand for the "seed" rule
    std::optional<BoardSize> boardSize;
    std::shared_ptr<engine::Clock> clock; // SteadyClock when empty
};

class Game {
public:
    explicit Game(engine::EngineParts parts = engine::presets::modern(),
                  GameOptions options = {});
    ~Game();

    // Parts keep a reference to their game
    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    std::uint64_t score() const noexcept { return scorer_->score(); }
    int level() const noexcept { return scorer_->level(); }

    // Visible dimensions
    int height() const noexcept { return board_.rows() / 2; }
    int width() const noexcept { return board_.cols(); }

    PlayingStatus status() const noexcept { return status_; }
    bool playing() const noexcept { return status_ == PlayingStatus::Playing; }
    bool paused() const noexcept { return status_ == PlayingStatus::Idle; }
    bool lost() const noexcept { return status_ == PlayingStatus::Stopped; }

    const Piece& piece() const noexcept { return piece_; }
    const Board& board() const noexcept { return board_; }
    const std::optional<PieceType>& hold() const noexcept { return hold_; }
    bool holdLocked() const noexcept { return holdLock_; }
    const std::optional<MoveDelta>& delta() const noexcept { return delta_; }

    // Visible rows with the ghost and active piece drawn in. A fresh copy.
    Board playfield() const { return getPlayfield(0); }
    Board getPlayfield(int bufferLines) const;

    // Iterates the visible window of upcoming pieces
    const engine::Queue& queue() const noexcept { return *queue_; }
    const std::string& seed() const noexcept { return queue_->seed(); }

    const Ruleset& rules() const noexcept { return rules_; }
    Ruleset& rules() noexcept { return rules_; }

    const engine::EngineParts& engine() const noexcept { return parts_; }
    const engine::RotationSystem& rotationSystem() const noexcept { return *rs_; }
    const engine::Gravity& gravity() const noexcept { return *gravity_; }
    const engine::Scorer& scorer() const noexcept { return *scorer_; }
    const engine::Clock& clock() const noexcept { return *clock_; }

    void push(const Move& move);
    void tick();

    // Toggle, or force with a value. Ignored once the game is lost.
    void pause(std::optional<bool> state = std::nullopt);

    // New board, parts, queue and score; the engine and rules stay
    void reset();

    void drag(int tiles) { push(Move::drag(tiles)); }
    void left(int tiles = 1) { push(Move::left(tiles)); }
    void right(int tiles = 1) { push(Move::right(tiles)); }
    void rotate(int turns = 1) { push(Move::rotate(turns)); }
    void hardDrop() { push(Move::hardDrop()); }
    void softDrop(int tiles = 1) { push(Move::softDrop(tiles)); }
    void swap() { push(Move::swap()); }

private:
    engine::EngineParts parts_;
    Ruleset rules_;
    Board board_;
    std::shared_ptr<engine::Clock> clock_;

    std::unique_ptr<engine::Gravity> gravity_;
    std::unique_ptr<engine::Queue> queue_;
    std::unique_ptr<engine::RotationSystem> rs_;
    std::unique_ptr<engine::Scorer> scorer_;

    Piece piece_{};
    std::optional<PieceType> hold_;
    bool holdLock_{false};
    std::optional<MoveDelta> delta_;
    PlayingStatus status_{PlayingStatus::Playing};

    void buildParts(std::vector<PieceType> queue, std::uint64_t score, std::optional<int> level);

    void shift(int dx, int dy, MoveDelta& delta);
    void rotatePiece(int turns, MoveDelta& delta);
    void swapHold();
    void lockPiece(MoveDelta& delta);
};

} // namespace modtris::core
