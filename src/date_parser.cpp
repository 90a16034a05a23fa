#include "date_parser.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace tripscope {

namespace {

// Excel serial day 0 is 1899-12-30 once the 1900 leap-year bug is accounted for.
constexpr double kMaxExcelSerial = 2958466.0;  // 10000-01-01

struct Token {
    enum class Kind { Number, Word };
    Kind kind;
    std::string text;
};

int monthFromName(const std::string& word) {
    static const char* kNames[12] = {"january", "february", "march", "april", "may", "june",
                                     "july", "august", "september", "october", "november", "december"};
    std::string lower = toLower(word);
    if (lower == "sept") {
        return 9;
    }
    for (int i = 0; i < 12; ++i) {
        std::string full = kNames[i];
        if (lower == full || (lower.size() == 3 && full.compare(0, 3, lower) == 0)) {
            return i + 1;
        }
    }
    return 0;
}

// Splits the date portion into number and word tokens. Only the usual date
// separators are allowed between them.
bool tokenizeDate(const std::string& text, std::vector<Token>& tokens) {
    std::size_t i = 0;
    while (i < text.size()) {
        unsigned char ch = static_cast<unsigned char>(text[i]);
        if (std::isdigit(ch)) {
            std::size_t start = i;
            while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
                ++i;
            }
            tokens.push_back(Token{Token::Kind::Number, text.substr(start, i - start)});
        } else if (std::isalpha(ch)) {
            std::size_t start = i;
            while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) {
                ++i;
            }
            tokens.push_back(Token{Token::Kind::Word, text.substr(start, i - start)});
        } else if (ch == '/' || ch == '-' || ch == '.' || ch == ',' || std::isspace(ch)) {
            ++i;
        } else {
            return false;
        }
    }
    return true;
}

// Position where a trailing "HH:MM..." part starts, or npos.
std::size_t timePartStart(const std::string& text) {
    std::size_t colon = text.find(':');
    if (colon == std::string::npos) {
        return std::string::npos;
    }
    std::size_t start = colon;
    while (start > 0 && std::isdigit(static_cast<unsigned char>(text[start - 1]))) {
        --start;
    }
    return start;
}

long toLong(const std::string& digits) {
    return std::strtol(digits.c_str(), nullptr, 10);
}

}  // namespace

DateParser::DateParser()
    : DateParser(Rules{}) {}

DateParser::DateParser(Rules rules)
    : rules_(rules) {}

int DateParser::expandYear(long year, std::size_t digits) const {
    if (digits <= 2) {
        return static_cast<int>(year < rules_.twoDigitYearPivot ? 2000 + year : 1900 + year);
    }
    return static_cast<int>(year);
}

std::optional<CivilDate> DateParser::resolveNumeric(long a, long b, long c, std::size_t yearDigits) const {
    int year = expandYear(c, yearDigits);
    long first = rules_.order == DateOrder::DayFirst ? a : b;
    long second = rules_.order == DateOrder::DayFirst ? b : a;
    // first = day, second = month under the configured order
    if (isValidDate(year, static_cast<int>(second), static_cast<int>(first))) {
        return CivilDate{year, static_cast<int>(second), static_cast<int>(first)};
    }
    if (isValidDate(year, static_cast<int>(first), static_cast<int>(second))) {
        return CivilDate{year, static_cast<int>(first), static_cast<int>(second)};
    }
    return std::nullopt;
}

std::optional<CivilDate> DateParser::parseDateText(const std::string& raw) const {
    std::string text = trim(raw);
    std::size_t timeStart = timePartStart(text);
    if (timeStart != std::string::npos) {
        if (!parseTimeText(text.substr(timeStart))) {
            return std::nullopt;
        }
        text = text.substr(0, timeStart);
        while (!text.empty() && (text.back() == 'T' || std::isspace(static_cast<unsigned char>(text.back())))) {
            text.pop_back();
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }

    std::vector<Token> tokens;
    if (!tokenizeDate(text, tokens) || tokens.size() != 3) {
        return std::nullopt;
    }

    std::size_t words = 0;
    for (const auto& token : tokens) {
        if (token.kind == Token::Kind::Word) {
            ++words;
        } else if (token.text.size() > 4) {
            return std::nullopt;
        }
    }

    if (words == 0) {
        const std::string& t0 = tokens[0].text;
        const std::string& t2 = tokens[2].text;
        if (t0.size() == 4) {
            int year = static_cast<int>(toLong(t0));
            int month = static_cast<int>(toLong(tokens[1].text));
            int day = static_cast<int>(toLong(t2));
            if (t2.size() > 2 || !isValidDate(year, month, day)) {
                return std::nullopt;
            }
            return CivilDate{year, month, day};
        }
        if (t0.size() > 2 || tokens[1].text.size() > 2 || (t2.size() != 2 && t2.size() != 4)) {
            return std::nullopt;
        }
        return resolveNumeric(toLong(t0), toLong(tokens[1].text), toLong(t2), t2.size());
    }

    if (words != 1) {
        return std::nullopt;
    }

    // D Mon Y or Mon D Y
    std::size_t wordIndex = tokens[0].kind == Token::Kind::Word ? 0 : (tokens[1].kind == Token::Kind::Word ? 1 : 2);
    if (wordIndex == 2) {
        return std::nullopt;
    }
    int month = monthFromName(tokens[wordIndex].text);
    if (month == 0) {
        return std::nullopt;
    }
    const Token& dayToken = wordIndex == 0 ? tokens[1] : tokens[0];
    const Token& yearToken = tokens[2];
    if (dayToken.text.size() > 2 || (yearToken.text.size() != 2 && yearToken.text.size() != 4)) {
        return std::nullopt;
    }
    int day = static_cast<int>(toLong(dayToken.text));
    int year = expandYear(toLong(yearToken.text), yearToken.text.size());
    if (!isValidDate(year, month, day)) {
        return std::nullopt;
    }
    return CivilDate{year, month, day};
}

std::optional<TimeOfDay> DateParser::parseTimeText(const std::string& raw) const {
    std::string text = trim(raw);
    std::size_t start = timePartStart(text);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    if (start > 0) {
        // "1900-01-01 08:15:00" style cells carry a throwaway date
        std::string prefix = trim(text.substr(0, start));
        if (!prefix.empty() && prefix.back() == 'T') {
            prefix.pop_back();
        }
        if (!prefix.empty() && !parseDateText(prefix)) {
            return std::nullopt;
        }
        text = text.substr(start);
    }

    std::size_t pos = 0;
    auto readField = [&](std::size_t maxDigits) -> long {
        std::size_t begin = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) && pos - begin < maxDigits) {
            ++pos;
        }
        if (pos == begin) {
            return -1;
        }
        return toLong(text.substr(begin, pos - begin));
    };

    long hour = readField(2);
    if (hour < 0 || pos >= text.size() || text[pos] != ':') {
        return std::nullopt;
    }
    ++pos;
    long minute = readField(2);
    if (minute < 0) {
        return std::nullopt;
    }
    double second = 0.0;
    if (pos < text.size() && text[pos] == ':') {
        ++pos;
        long whole = readField(2);
        if (whole < 0) {
            return std::nullopt;
        }
        second = static_cast<double>(whole);
        if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
            ++pos;
            std::size_t begin = pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                ++pos;
            }
            if (pos == begin) {
                return std::nullopt;
            }
            std::string fraction = "0." + text.substr(begin, pos - begin);
            second += std::strtod(fraction.c_str(), nullptr);
        }
    }

    std::string suffix = toLower(trim(text.substr(pos)));
    if (suffix == "am" || suffix == "pm") {
        if (hour < 1 || hour > 12) {
            return std::nullopt;
        }
        hour %= 12;
        if (suffix == "pm") {
            hour += 12;
        }
    } else if (!suffix.empty() && suffix != "z") {
        return std::nullopt;
    }

    if (hour > 23 || minute > 59 || second >= 60.0) {
        return std::nullopt;
    }
    return TimeOfDay{static_cast<int>(hour), static_cast<int>(minute), second};
}

std::optional<CivilDate> DateParser::parseDate(const RawCell& cell) const {
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return parseDateText(*text);
    }
    if (const auto* serial = std::get_if<double>(&cell)) {
        if (!std::isfinite(*serial) || *serial < 1.0 || *serial >= kMaxExcelSerial) {
            return std::nullopt;
        }
        std::int64_t base = daysFromCivil(1899, 12, 30);
        return civilFromDays(base + static_cast<std::int64_t>(std::floor(*serial)));
    }
    if (const auto* stamp = std::get_if<DateTime>(&cell)) {
        return stamp->date();
    }
    return std::nullopt;
}

std::optional<TimeOfDay> DateParser::parseTime(const RawCell& cell) const {
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return parseTimeText(*text);
    }
    if (const auto* fraction = std::get_if<double>(&cell)) {
        if (!std::isfinite(*fraction) || *fraction < 0.0 || *fraction >= 1.0) {
            return std::nullopt;
        }
        double seconds = std::round(*fraction * 86400.0 * 1e6) / 1e6;
        if (seconds >= 86400.0) {
            return std::nullopt;
        }
        return DateTime(seconds).timeOfDay();
    }
    if (const auto* stamp = std::get_if<DateTime>(&cell)) {
        return stamp->timeOfDay();
    }
    return std::nullopt;
}

std::optional<DateTime> DateParser::parseDateTime(const RawCell& dateCell, const RawCell& timeCell) const {
    auto date = parseDate(dateCell);
    if (!date) {
        return std::nullopt;
    }
    auto time = parseTime(timeCell);
    if (!time) {
        return std::nullopt;
    }
    return DateTime::fromCivil(*date, *time);
}

}  // namespace tripscope
