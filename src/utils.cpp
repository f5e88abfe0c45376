#include "utils.hpp"

namespace Dotsync {

std::string trim(const std::string& input)
{
    const char* whitespace = " \t\n\r\f\v";
    size_t first = input.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = input.find_last_not_of(whitespace);
    return input.substr(first, last - first + 1);
}

std::vector<std::string> splitCommaList(const std::string& input)
{
    std::vector<std::string> items;
    size_t start = 0;

    while (start <= input.size()) {
        size_t comma = input.find(',', start);
        if (comma == std::string::npos) {
            comma = input.size();
        }
        std::string item = trim(input.substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = comma + 1;
    }
    return items;
}

std::string joinQuoted(const std::vector<std::string>& items)
{
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += "'" + items[i] + "'";
    }
    return joined;
}

} // namespace Dotsync
