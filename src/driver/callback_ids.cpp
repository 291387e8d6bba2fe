#include "callback_ids.hpp"

namespace zwlink {

uint8_t CallbackIdAllocator::allocate() {
  std::lock_guard<std::mutex> lk(mtx_);
  uint8_t id = last_;
  for (int i = 0; i < 255; i++) {
    id = (uint8_t)(id % 255 + 1);
    if (!used_.test(id)) {
      used_.set(id);
      last_ = id;
      return id;
    }
  }
  return 0;
}

void CallbackIdAllocator::release(uint8_t id) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (id != 0)
    used_.reset(id);
}

bool CallbackIdAllocator::in_use(uint8_t id) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return id != 0 && used_.test(id);
}

size_t CallbackIdAllocator::outstanding() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return used_.count();
}

} // namespace zwlink
