#pragma once

#include "core/types.hpp"

namespace seasonal {

// CIEDE2000 color difference with kL = kC = kH = 1.
// Non-negative and symmetric in its arguments.
double delta_e_2000(const Lab& lab1, const Lab& lab2);

// CIE76: plain Euclidean distance in Lab.
double delta_e_76(const Lab& lab1, const Lab& lab2);

}
