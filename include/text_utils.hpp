#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tripscope {

std::string trim(const std::string& s);
std::string toLower(std::string s);

// Whole-token parse after trimming is left to the caller; trailing
// characters make the parse fail.
bool parseDouble(const std::string& token, double& out);

// Comma-separated whole positive meters ("1,10,50"). Fractions, signs,
// overflow and empty entries are rejected with nullopt.
std::optional<std::vector<int>> parseOffsetList(const std::string& text);

// JSON string body: quotes, backslashes and every byte below 0x20 escaped.
std::string jsonEscape(const std::string& text);

}  // namespace tripscope
