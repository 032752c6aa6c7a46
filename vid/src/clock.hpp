#pragma once
#include <cstdint>
#include <functional>

namespace vid {

// Millisecond time source. Injected into the generator so tests can pin time.
using Clock = std::function<uint64_t()>;

// Milliseconds since the Unix epoch from the system wall clock.
uint64_t now_ms();

Clock system_clock();

// Always returns ms.
Clock fixed_clock(uint64_t ms);

} // namespace vid
