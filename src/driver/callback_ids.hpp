#pragma once
#include <bitset>
#include <cstdint>
#include <mutex>

namespace zwlink {

// Hands out callback ids 1..255 in wrapping order, skipping ids that are
// still outstanding. 0 is never handed out.
class CallbackIdAllocator {
public:
    // Returns 0 when every id is outstanding.
    uint8_t allocate();
    void release(uint8_t id);
    bool in_use(uint8_t id) const;
    size_t outstanding() const;
private:
    mutable std::mutex mtx_;
    uint8_t last_{0};
    std::bitset<256> used_;
};

} // namespace zwlink
