#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

constexpr int kReportDigits = 12;

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline std::string formatFixed(double value, int digits) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(digits) << value;
    return os.str();
}

/**
 * @brief Rounds to a fixed number of decimal digits through the decimal representation.
 * @details Going through text keeps the result identical to the value a reader would parse
 *          back from a report, independent of the platform's floating-point multiply.
 * @post Non-finite input is returned unchanged.
 */
inline double roundDigits(double value, int digits = kReportDigits) {
    if (!std::isfinite(value)) return value;
    const std::string text = formatFixed(value, digits);
    return std::strtod(text.c_str(), nullptr);
}

inline std::vector<std::string> splitList(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            out.push_back(trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(trim(cur));
    return out;
}

} // namespace CommonUtils
