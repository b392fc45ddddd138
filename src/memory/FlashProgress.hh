#ifndef FLASHPROGRESS_HH
#define FLASHPROGRESS_HH

#include <cstddef>
#include <functional>

namespace flashkit {

/** Called with the number of bytes processed so far and the total. */
using ProgressCallback = std::function<void(size_t done, size_t total)>;

} // namespace flashkit

#endif
