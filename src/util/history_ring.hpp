#pragma once
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace mpng {
// Fixed-capacity circular log. `push` overwrites the slot at write_index()
// and advances it modulo capacity, so after capacity() pushes every slot has
// been rewritten once and write_index() is back where it started.
template <typename T>
class HistoryRing {
   public:
    HistoryRing(std::size_t capacity, const T& fill) : slots_(capacity, fill) {
        if (capacity == 0) throw std::invalid_argument("history capacity must be positive");
    }

    void push(const T& value) {
        slots_[write_index_] = value;
        write_index_ = (write_index_ + 1) % slots_.size();
        ++pushes_;
    }

    std::size_t capacity() const {
        return slots_.size();
    }
    std::size_t write_index() const {
        return write_index_;
    }
    std::size_t pushes() const {
        return pushes_;
    }
    const T& at(std::size_t slot) const {
        return slots_.at(slot);
    }
    // Most recently pushed value; only meaningful once pushes() > 0.
    const T& newest() const {
        return slots_[(write_index_ + slots_.size() - 1) % slots_.size()];
    }
    // All slots, oldest first; never-written slots keep the fill value.
    std::vector<T> ordered() const {
        std::vector<T> out;
        out.reserve(slots_.size());
        for (std::size_t i = 0; i < slots_.size(); ++i)
            out.push_back(slots_[(write_index_ + i) % slots_.size()]);
        return out;
    }

   private:
    std::vector<T> slots_;
    std::size_t write_index_{0};
    std::size_t pushes_{0};
};
}  // namespace mpng
