#include "text.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace conz {

namespace {

std::vector<std::string> split(const std::string& s, const std::string& sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string rewrap(const std::string& s, int width) {
    if (width <= 0) {
        width = DEFAULT_WIDTH;
    }
    const size_t max_len = static_cast<size_t>(width);

    // Collect words of the whole paragraph.
    std::istringstream words(trim(s));
    std::vector<std::string> lines;
    std::string current;
    std::string word;

    while (words >> word) {
        // Split words that can never fit on a line.
        while (word.size() > max_len) {
            if (!current.empty()) {
                size_t room = max_len > current.size() + 1 ? max_len - current.size() - 1 : 0;
                if (room > 0) {
                    current += " " + word.substr(0, room);
                    word = word.substr(room);
                }
                lines.push_back(current);
                current.clear();
                continue;
            }
            lines.push_back(word.substr(0, max_len));
            word = word.substr(max_len);
        }

        if (word.empty()) {
            continue;
        }
        if (current.empty()) {
            current = word;
        } else if (current.size() + 1 + word.size() <= max_len) {
            current += " " + word;
        } else {
            lines.push_back(current);
            current = word;
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }

    return join(lines, "\n");
}

std::string rewrap_long(const std::string& s, int width) {
    std::vector<std::string> paragraphs = split(s, "\n\n");
    for (auto& paragraph : paragraphs) {
        paragraph = rewrap(paragraph, width);
    }
    return join(paragraphs, "\n\n");
}

std::string striplines(const std::string& s) {
    std::vector<std::string> lines = split(trim(s), "\n");
    for (auto& line : lines) {
        line = trim(line);
    }
    return join(lines, "\n");
}

std::optional<int> safeint(const std::string& s) {
    std::string value = trim(s);
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        int result = std::stoi(value, &consumed, 10);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace conz
