#pragma once
#include <ostream>
#include "check_new_line/types.hpp"

namespace check_new_line {
    void render_summary(const RunStats& stats, bool fix, std::ostream& out);
}
