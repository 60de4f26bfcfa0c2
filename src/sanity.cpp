#include "hwident/sanity.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace hwident {

namespace {

// Compared case-insensitively against the trimmed value
constexpr std::array<const char*, 14> kPlaceholders = {
    "To be filled by O.E.M.",
    "Default string",
    "None",
    "N/A",
    "Not Specified",
    "Not Applicable",
    "Not Available",
    "System Serial Number",
    "System Product Name",
    "Base Board Serial Number",
    "Chassis Serial Number",
    "O.E.M.",
    "Unknown",
    "0123456789",
};

bool is_trim_char(char c) {
    return c == '\0' || std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool iequals(const std::string& a, const char* b) {
    std::string rhs(b);
    if (a.size() != rhs.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), rhs.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

}  // namespace

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(), is_trim_char);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_trim_char).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

bool is_placeholder(const std::string& value) {
    return std::any_of(kPlaceholders.begin(), kPlaceholders.end(),
                       [&value](const char* p) { return iequals(value, p); });
}

bool is_degenerate(const std::string& value) {
    bool all_zero = true;
    bool all_f = true;

    for (char c : value) {
        if (c == '-' || c == ' ') {
            continue;
        }
        if (c != '0') {
            all_zero = false;
        }
        if (c != 'f' && c != 'F') {
            all_f = false;
        }
        if (!all_zero && !all_f) {
            return false;
        }
    }

    // Only separators, or a single repeated 0/F
    return true;
}

std::optional<std::string> sanitize(const std::string& raw) {
    std::string value = trim(raw);

    if (value.empty() || is_degenerate(value) || is_placeholder(value)) {
        return std::nullopt;
    }

    return value;
}

}  // namespace hwident
