#include <stdexcept>

#include "../src/util/history_ring.hpp"

int main() {
    mpng::HistoryRing<int> ring(5, 0);
    if (ring.write_index() != 0) return 1;
    for (int cycle = 1; cycle <= 7; ++cycle) {
        ring.push(cycle);
        if (ring.write_index() >= ring.capacity()) return 2;
    }
    // capacity 5, 7 cycles: slot (cycle - 1) % 5 holds the cycle, 1 and 2 are gone
    if (ring.at(0) != 6 || ring.at(1) != 7) return 3;
    if (ring.at(2) != 3 || ring.at(3) != 4 || ring.at(4) != 5) return 4;
    auto ordered = ring.ordered();
    for (int i = 0; i < 5; ++i)
        if (ordered[i] != i + 3) return 5;
    if (ring.newest() != 7) return 6;

    mpng::HistoryRing<int> lap(4, -1);
    std::size_t start = lap.write_index();
    for (int i = 0; i < 4; ++i) lap.push(i);
    if (lap.write_index() != start) return 7;
    for (std::size_t i = 0; i < 4; ++i)
        if (lap.at(i) == -1) return 8;

    bool threw = false;
    try {
        mpng::HistoryRing<int> empty(0, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) return 9;
    return 0;
}
