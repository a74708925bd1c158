#include "chunkbus/transport/transport.hpp"

#include <string_view>
#include <vector>

namespace chunkbus::transport {

namespace {

std::vector<std::string_view> split_levels(std::string_view value) {
    std::vector<std::string_view> levels;
    std::size_t start = 0;
    while (true) {
        const auto slash = value.find('/', start);
        if (slash == std::string_view::npos) {
            levels.push_back(value.substr(start));
            return levels;
        }
        levels.push_back(value.substr(start, slash - start));
        start = slash + 1;
    }
}

} // namespace

bool topic_matches(const std::string& filter, const std::string& topic) {
    const auto filter_levels = split_levels(filter);
    const auto topic_levels = split_levels(topic);

    std::size_t i = 0;
    for (; i < filter_levels.size(); ++i) {
        const auto level = filter_levels[i];
        if (level == "#") {
            return i + 1 == filter_levels.size();
        }
        if (i >= topic_levels.size()) {
            return false;
        }
        if (level != "+" && level != topic_levels[i]) {
            return false;
        }
    }
    return i == topic_levels.size();
}

} // namespace chunkbus::transport
