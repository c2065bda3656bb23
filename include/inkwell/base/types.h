#pragma once

#include <cstdint>
#include <cstddef>

namespace inkwell {
namespace base {

using ObjectId = uint64_t;

} // namespace base
} // namespace inkwell
