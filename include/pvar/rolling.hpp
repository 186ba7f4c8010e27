#pragma once

#include <cstddef>

#include <pvar/returns.hpp>

namespace pvar {

// out[k] = prod_{j<window} (1 + daily[k + j]) - 1. Empty when the series is
// shorter than the window. Each value is dated at the last day of its window.
ReturnSeries compound_rolling(const ReturnSeries& daily, std::size_t window);

} // namespace pvar
