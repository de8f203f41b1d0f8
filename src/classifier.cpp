#include <algorithm>
#include "check_new_line/classifier.hpp"

namespace check_new_line {

    namespace {
        // Ratio kNonPrintableNumerator / kNonPrintableDenominator, compared exactly.
        constexpr std::size_t kNonPrintableNumerator = 3;
        constexpr std::size_t kNonPrintableDenominator = 10;

        bool is_non_printable(unsigned char byte) {
            return byte < 0x20 && byte != '\n' && byte != '\r' && byte != '\t';
        }
    }

    bool is_binary(std::string_view data) {
        if (data.empty()) {
            return false;
        }

        if (data.find('\0') != std::string_view::npos) {
            return true;
        }

        const auto non_printable = static_cast<std::size_t>(
            std::count_if(data.begin(), data.end(), [](char ch) {
                return is_non_printable(static_cast<unsigned char>(ch));
            }));

        return non_printable * kNonPrintableDenominator > data.size() * kNonPrintableNumerator;
    }
}
