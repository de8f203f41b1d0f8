#pragma once
#include <string_view>

namespace check_new_line {
    // True when the buffer looks like binary data: it contains a NUL byte, or
    // more than 30% of its bytes are control characters other than \n, \r, \t.
    bool is_binary(std::string_view data);
}
