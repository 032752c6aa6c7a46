#include "clock.hpp"
#include <chrono>

namespace vid {

uint64_t now_ms() {
    using namespace std::chrono;
    auto since_epoch = system_clock::now().time_since_epoch();
    return (uint64_t)duration_cast<milliseconds>(since_epoch).count();
}

Clock system_clock() {
    return [] { return now_ms(); };
}

Clock fixed_clock(uint64_t ms) {
    return [ms] { return ms; };
}

} // namespace vid
