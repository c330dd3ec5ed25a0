#include "engine/Queue.hpp"
#include "core/Game.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace modtris::engine {

using core::AllPieceTypes;
using core::PieceType;

namespace {

// 16 bytes from the system entropy source, rendered as hex
std::string randomSeed() {
    std::random_device device;
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        out << std::setw(2) << (device() & 0xFFu);
    }
    return out.str();
}

std::string seedText(const core::RuleValue& seed) {
    if (const auto* text = std::get_if<std::string>(&seed)) {
        return *text;
    }
    if (const auto* number = std::get_if<int>(&seed)) {
        return std::to_string(*number);
    }
    return randomSeed();
}

template <typename T>
std::unique_ptr<T> makeQueue(const core::Game& game, std::vector<PieceType> pieces) {
    auto queue = std::make_unique<T>(game.rules().value("seed"), std::move(pieces));
    queue->setSize(game.rules().get<int>("queue_size"));
    queue->topUp();
    return queue;
}

} // namespace

std::uint32_t fnv1a(const std::string& bytes) noexcept {
    std::uint32_t hash = 2166136261u;
    for (unsigned char byte : bytes) {
        hash ^= byte;
        hash *= 16777619u;
    }
    return hash;
}

Queue::Queue(const core::RuleValue& seed, std::vector<PieceType> pieces)
    : pieces_(pieces.begin(), pieces.end())
    , seed_{seedText(seed)}
    , rng_{fnv1a(seed_)}
{
}

PieceType Queue::pop() {
    topUp();
    const PieceType head = pieces_.front();
    pieces_.pop_front();
    return head;
}

void Queue::topUp() {
    while (pieces_.size() <= static_cast<std::size_t>(size_)) {
        const std::size_t before = pieces_.size();
        fill();
        if (pieces_.size() <= before) {
            throw std::logic_error("Queue: fill() did not add any piece");
        }
    }
}

void Queue::setSize(int size) {
    if (size < 0) {
        throw std::invalid_argument("Queue: negative window size");
    }
    size_ = size;
}

PieceType Queue::operator[](std::size_t index) const {
    if (index >= static_cast<std::size_t>(size_)) {
        throw std::out_of_range("Queue: index past the visible window");
    }
    return pieces_.at(index);
}

Queue::const_iterator Queue::end() const noexcept {
    const std::size_t visible = std::min(pieces_.size(), static_cast<std::size_t>(size_));
    return pieces_.begin() + static_cast<std::ptrdiff_t>(visible);
}

std::uint32_t Queue::randomBelow(std::uint32_t bound) {
    // Reject the top partial stripe of the 32-bit range so every residue is
    // equally likely.
    const std::uint64_t range = std::uint64_t{1} << 32;
    const std::uint64_t limit = range - range % bound;
    for (;;) {
        const std::uint64_t value = rng_();
        if (value < limit) {
            return static_cast<std::uint32_t>(value % bound);
        }
    }
}

std::unique_ptr<SevenBag> SevenBag::fromGame(const core::Game& game,
                                             std::vector<PieceType> pieces) {
    return makeQueue<SevenBag>(game, std::move(pieces));
}

void SevenBag::fill() {
    auto bag = AllPieceTypes;
    for (auto i = static_cast<std::uint32_t>(bag.size() - 1); i > 0; --i) {
        std::swap(bag[i], bag[randomBelow(i + 1)]);
    }
    pieces_.insert(pieces_.end(), bag.begin(), bag.end());
}

std::unique_ptr<Chaotic> Chaotic::fromGame(const core::Game& game,
                                           std::vector<PieceType> pieces) {
    return makeQueue<Chaotic>(game, std::move(pieces));
}

void Chaotic::fill() {
    pieces_.push_back(AllPieceTypes[randomBelow(static_cast<std::uint32_t>(AllPieceTypes.size()))]);
}

NesQueue::NesQueue(const core::RuleValue& seed, std::vector<PieceType> pieces)
    : Queue(seed, std::move(pieces))
{
    if (!pieces_.empty()) {
        last_ = pieces_.back();
    }
}

std::unique_ptr<NesQueue> NesQueue::fromGame(const core::Game& game,
                                             std::vector<PieceType> pieces) {
    return makeQueue<NesQueue>(game, std::move(pieces));
}

void NesQueue::fill() {
    // 8 outcomes, the last one meaning "reroll"
    constexpr auto kinds = static_cast<std::uint32_t>(AllPieceTypes.size());
    std::uint32_t roll = randomBelow(kinds + 1);
    if (roll == kinds || (last_ && AllPieceTypes[roll] == *last_)) {
        roll = randomBelow(kinds);
    }
    last_ = AllPieceTypes[roll];
    pieces_.push_back(*last_);
}

} // namespace modtris::engine
