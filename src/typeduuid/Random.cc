#include "typeduuid/Random.hh"

#include "Logging.hh"

#include <algorithm>
#include <array>
#include <functional>
#include <string_view>

namespace TypedUuid {

using namespace std::string_view_literals;

namespace {

Rng createSeededRng()
{
    // Seed the whole state, not just one word of it
    auto seedData = std::array<std::random_device::result_type, Rng::state_size> {};
    auto randomDevice = std::random_device {};
    std::generate(seedData.begin(), seedData.end(), std::ref(randomDevice));
    auto seeds = std::seed_seq(seedData.begin(), seedData.end());
    return Rng {seeds};
}

}

Rng& getRng()
{
    thread_local Rng randomEngine {createSeededRng()};
    return randomEngine;
}

void seedRng(const Rng::result_type seed)
{
    log(LogLevel::DEBUG, "Reseeding random number generator with %d"sv, seed);
    getRng().seed(seed);
}

}
