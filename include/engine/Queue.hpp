#pragma once

#include "core/Ruleset.hpp"
#include "core/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace modtris::core {
class Game;
}

namespace modtris::engine {

// Upcoming pieces.
//
// The buffer always holds more pieces than the visible window so that a pop
// never leaves the window short. Subclasses only decide what fill() appends.
class Queue {
public:
    using const_iterator = std::deque<core::PieceType>::const_iterator;

    // seed: unset, an int or a string (the "seed" rule)
    explicit Queue(const core::RuleValue& seed, std::vector<core::PieceType> pieces = {});
    virtual ~Queue() = default;

    static core::RuleOverrides ruleOverrides() { return {}; }
    static std::optional<core::Ruleset> rules() { return std::nullopt; }

    core::PieceType pop();

    // Refill until the buffer is longer than the window
    void topUp();

    void setSize(int size);
    int size() const noexcept { return size_; }

    core::PieceType operator[](std::size_t index) const;
    const_iterator begin() const noexcept { return pieces_.begin(); }
    const_iterator end() const noexcept;

    // Whole buffer, window first
    const std::deque<core::PieceType>& buffer() const noexcept { return pieces_; }

    // The effective seed, as text (random hex when none was given)
    const std::string& seed() const noexcept { return seed_; }

protected:
    // Append at least one piece to pieces_
    virtual void fill() = 0;

    // Uniform integer in [0, bound)
    std::uint32_t randomBelow(std::uint32_t bound);

    std::deque<core::PieceType> pieces_;

private:
    std::string seed_;
    std::mt19937 rng_;
    int size_{7};
};

std::uint32_t fnv1a(const std::string& bytes) noexcept;

// Shuffled permutations of all seven pieces
class SevenBag : public Queue {
public:
    using Queue::Queue;

    static std::unique_ptr<SevenBag> fromGame(const core::Game& game,
                                              std::vector<core::PieceType> pieces);

protected:
    void fill() override;
};

// Independent uniform draws, repeats allowed
class Chaotic : public Queue {
public:
    using Queue::Queue;

    static std::unique_ptr<Chaotic> fromGame(const core::Game& game,
                                             std::vector<core::PieceType> pieces);

protected:
    void fill() override;
};

// NES randomizer: one reroll when the first roll repeats the last piece
class NesQueue : public Queue {
public:
    NesQueue(const core::RuleValue& seed, std::vector<core::PieceType> pieces = {});

    static std::unique_ptr<NesQueue> fromGame(const core::Game& game,
                                              std::vector<core::PieceType> pieces);

protected:
    void fill() override;

private:
    std::optional<core::PieceType> last_;
};

} // namespace modtris::engine
