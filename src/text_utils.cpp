#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace tripscope {

std::string trim(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseDouble(const std::string& token, double& out) {
    try {
        std::size_t idx = 0;
        double value = std::stod(token, &idx);
        if (idx != token.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::optional<std::vector<int>> parseOffsetList(const std::string& text) {
    std::vector<int> offsets;
    std::istringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ',')) {
        std::string digits = trim(token);
        if (digits.empty() || digits.size() > 9) {
            return std::nullopt;
        }
        long value = 0;
        for (char ch : digits) {
            if (!std::isdigit(static_cast<unsigned char>(ch))) {
                return std::nullopt;
            }
            value = value * 10 + (ch - '0');
        }
        if (value <= 0 || value > INT_MAX) {
            return std::nullopt;
        }
        offsets.push_back(static_cast<int>(value));
    }
    if (offsets.empty()) {
        return std::nullopt;
    }
    return offsets;
}

std::string jsonEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    out += buffer;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

}  // namespace tripscope
