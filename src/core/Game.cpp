#include "core/Game.hpp"

#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace modtris::core {

namespace {

Ruleset baseRules(const GameOptions& options) {
    Ruleset rules({
        Rule{"board_size", {RuleType::BoardSize}, BoardSize{20, 10}},
        Rule{"initial_level", {RuleType::Int}, 1},
        Rule{"queue_size", {RuleType::Int}, 4},
        Rule{"seed", {RuleType::None, RuleType::Int, RuleType::String}, RuleValue{}},
        Rule{"can_180_spin", {RuleType::Bool}, true},
        Rule{"can_hard_drop", {RuleType::Bool}, true},
    });

    if (!std::holds_alternative<std::monostate>(options.seed)) {
        rules.set("seed", options.seed);
    }
    if (options.boardSize) {
        rules.set("board_size", *options.boardSize);
    }
    return rules;
}

// Every override is applied before the board is sized, so a caller's
// board_size always reaches the board
Ruleset resolveRules(const engine::EngineParts& parts, const GameOptions& options) {
    Ruleset rules = baseRules(options);

    rules.override(parts.gravity.ruleOverrides());
    rules.override(parts.queue.ruleOverrides());
    rules.override(parts.rotationSystem.ruleOverrides());
    rules.override(parts.scorer.ruleOverrides());

    for (const auto& sub : {parts.gravity.rules(), parts.queue.rules(),
                            parts.rotationSystem.rules(), parts.scorer.rules()}) {
        if (sub) {
            rules.registerRules(*sub);
        }
    }

    rules.override(options.ruleOverrides);
    return rules;
}

Board initialBoard(const GameOptions& options, Ruleset& rules) {
    if (options.board) {
        if (options.board->rows() <= 0 || options.board->cols() <= 0) {
            throw std::invalid_argument("Game: board must have positive dimensions");
        }
        const BoardSize actual{options.board->rows() / 2, options.board->cols()};
        const bool sizeRequested = options.boardSize.has_value()
                                   || options.ruleOverrides.count("board_size") != 0;
        if (sizeRequested && !(rules.get<BoardSize>("board_size") == actual)) {
            throw std::invalid_argument("Game: board_size does not match the provided board");
        }
        rules.set("board_size", actual);
        return *options.board;
    }
    // Twice the visible height, the top half buffers pieces pushed above view
    const BoardSize& size = rules.get<BoardSize>("board_size");
    if (size.height <= 0 || size.width <= 0) {
        throw std::invalid_argument("Game: board_size must be positive");
    }
    return Board(size.height * 2, size.width);
}

int step(int n) {
    return n < 0 ? -1 : 1;
}

} // namespace

Game::Game(engine::EngineParts parts, GameOptions options)
    : parts_{std::move(parts)}
    , rules_{resolveRules(parts_, options)}
    , board_{initialBoard(options, rules_)}
    , clock_{options.clock ? std::move(options.clock) : std::make_shared<engine::SteadyClock>()}
{
    buildParts(std::move(options.queue), options.score, options.level);
}

Game::~Game() = default;

void Game::buildParts(std::vector<PieceType> queue, std::uint64_t score, std::optional<int> level) {
    gravity_ = parts_.gravity.build(*this);
    queue_ = parts_.queue.build(*this, std::move(queue));
    rs_ = parts_.rotationSystem.build(*this);
    scorer_ = parts_.scorer.build(*this, score, level);

    piece_ = rs_->spawn(queue_->pop());
    queue_->topUp();

    status_ = PlayingStatus::Playing;
    delta_.reset();
    hold_.reset();
    holdLock_ = false;
}

void Game::reset() {
    board_.fill(0);
    buildParts({}, 0, std::nullopt);
}

void Game::pause(std::optional<bool> state) {
    if (lost()) {
        return;
    }
    const bool idle = state ? *state : playing();
    status_ = idle ? PlayingStatus::Idle : PlayingStatus::Playing;
}

Board Game::getPlayfield(int bufferLines) const {
    const int rows = board_.rows();
    if (bufferLines < 0 || bufferLines > rows - height()) {
        throw std::out_of_range("Game: buffer lines outside the hidden area");
    }

    Board view = board_.copy();

    int ghostX = piece_.x;
    while (!rs_->overlaps(piece_.minos, ghostX + 1, piece_.y)) {
        ++ghostX;
    }

    const auto draw = [&](int row, int col, Board::Cell value) {
        if (row >= 0 && row < rows && col >= 0 && col < view.cols()) {
            view.setCell(row, col, value);
        }
    };
    for (const Mino& m : piece_.minos) {
        draw(ghostX + m.x, piece_.y + m.y, minoCode(MinoType::Ghost));
    }
    for (const Mino& m : piece_.minos) {
        draw(piece_.x + m.x, piece_.y + m.y, minoCode(piece_.type));
    }

    return view.rows(rows - height() - bufferLines, rows);
}

void Game::push(const Move& move) {
    if (status_ != PlayingStatus::Playing) {
        return;
    }

    MoveDelta delta;
    delta.kind = move.kind;
    delta.rx = move.x;
    delta.ry = move.y;
    delta.rr = move.r;
    delta.automatic = move.automatic;

    switch (move.kind) {
    case MoveKind::Drag:
        shift(0, move.y, delta);
        break;
    case MoveKind::SoftDrop:
        shift(std::max(move.x, 0), 0, delta); // never upward
        break;
    case MoveKind::Rotate:
        rotatePiece(move.r, delta);
        break;
    case MoveKind::Swap:
        swapHold();
        break;
    case MoveKind::HardDrop:
        if (move.automatic || rules_.get<bool>("can_hard_drop")) {
            lockPiece(delta);
        } else {
            delta.piece = piece_;
        }
        break;
    }

    if (move.kind != MoveKind::HardDrop) {
        delta.piece = piece_;
    }

    queue_->setSize(rules_.get<int>("queue_size"));
    queue_->topUp();

    delta_ = std::move(delta);
    scorer_->judge(*delta_);

    if (!move.automatic) {
        if (auto next = gravity_->calculate(&*delta_)) {
            push(*next);
        }
    }
}

void Game::tick() {
    // Timers keep running while paused; the move itself is dropped by push()
    if (auto next = gravity_->calculate()) {
        push(*next);
    }
}

void Game::shift(int dx, int dy, MoveDelta& delta) {
    const int sx = step(dx);
    for (int i = 0; i < std::abs(dx); ++i) {
        if (rs_->overlaps(piece_.minos, piece_.x + sx, piece_.y)) {
            break;
        }
        piece_.x += sx;
        delta.x += sx;
    }

    const int sy = step(dy);
    for (int i = 0; i < std::abs(dy); ++i) {
        if (rs_->overlaps(piece_.minos, piece_.x, piece_.y + sy)) {
            break;
        }
        piece_.y += sy;
        delta.y += sy;
    }
}

void Game::rotatePiece(int turns, MoveDelta& delta) {
    if ((turns % 4 + 4) % 4 == 2 && !rules_.get<bool>("can_180_spin")) {
        return;
    }

    const Piece before = piece_;
    rs_->rotate(piece_, turns);
    assert(!rs_->overlaps(piece_) && "rotation left the piece overlapping");

    delta.x = piece_.x - before.x;
    delta.y = piece_.y - before.y;
    delta.r = piece_.r == before.r ? 0 : turns; // signed, as requested
}

void Game::swapHold() {
    if (holdLock_) {
        return;
    }
    if (!hold_) {
        hold_ = queue_->pop();
    }

    const PieceType next = *hold_;
    hold_ = piece_.type;
    piece_ = rs_->spawn(next);
    holdLock_ = true;
    assert(!rs_->overlaps(piece_) && "held piece spawned overlapping");
}

void Game::lockPiece(MoveDelta& delta) {
    while (!rs_->overlaps(piece_.minos, piece_.x + 1, piece_.y)) {
        ++piece_.x;
        ++delta.x;
    }

    bool visible = false;
    for (const Mino& m : piece_.minos) {
        board_.setCell(piece_.x + m.x, piece_.y + m.y, minoCode(piece_.type));
        visible = visible || piece_.x + m.x >= height();
    }
    if (!visible) {
        status_ = PlayingStatus::Stopped; // lock out
    }

    delta.piece = piece_;
    delta.locked = true;

    for (int row = 0; row < board_.rows(); ++row) {
        if (board_.isRowFull(row)) {
            board_.removeRow(row);
            delta.clears.push_back(row);
        }
    }

    piece_ = rs_->spawn(queue_->pop());
    if (rs_->overlaps(piece_)) {
        status_ = PlayingStatus::Stopped; // block out
    }

    holdLock_ = false;
}

} // namespace modtris::core
