/**
 * CardForge Engine - Identifier Factory Implementation
 */

#include "id_factory.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace cardforge {

namespace {

std::mt19937_64& id_rng() {
    thread_local std::mt19937_64 rng([] {
        std::random_device rd;
        auto ticks = static_cast<uint64_t>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count());
        return (static_cast<uint64_t>(rd()) << 32) ^ rd() ^ ticks;
    }());
    return rng;
}

} // anonymous namespace

std::string generate_uuid() {
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(id_rng());
    uint64_t lo = dist(id_rng());

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::mt19937& engine_rng() {
    thread_local std::mt19937 rng(std::random_device{}());
    return rng;
}

} // namespace cardforge
