#pragma once

// -------------------------------------------------------------------------
// 1. STANDARD C++ LIBRARY (Commonly used across the project)
// -------------------------------------------------------------------------
// Containers
#include <vector>
#include <string>
#include <string_view>
#include <span>
#include <optional>
#include <variant>
#include <utility> // std::pair
#include <functional> // std::function

// Math & Algorithms
#include <cmath>
#include <algorithm>
#include <numeric> // std::accumulate
#include <limits>  // std::numeric_limits
#include <compare> // std::strong_ordering

// IO & Strings
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <charconv> // std::from_chars
#include <cstdint>
#include <cstddef>
#include <stdexcept>

#include <memory>
