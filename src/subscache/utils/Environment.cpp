#include "utils/Environment.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace {

auto is_space(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

namespace SC {

auto parse_truthy(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    auto text = trim(std::string_view{value});
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no") {
        return false;
    }
    return true;
}

auto env_truthy(char const* name) -> bool {
    return parse_truthy(std::getenv(name));
}

auto env_size(char const* name) -> std::optional<std::size_t> {
    char const* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    auto text = trim(std::string_view{raw});
    if (text.empty()) {
        return std::nullopt;
    }
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto env_list(char const* name) -> std::vector<std::string> {
    char const* raw = std::getenv(name);
    if (raw == nullptr) {
        return {};
    }
    return split_list(raw);
}

auto split_list(std::string_view text, char delimiter) -> std::vector<std::string> {
    std::vector<std::string> items;
    std::size_t              pos = 0;
    while (pos <= text.size()) {
        auto next  = text.find(delimiter, pos);
        auto end   = (next == std::string_view::npos) ? text.size() : next;
        auto token = trim(text.substr(pos, end - pos));
        if (!token.empty()) {
            items.emplace_back(token);
        }
        if (next == std::string_view::npos) {
            break;
        }
        pos = next + 1;
    }
    return items;
}

} // namespace SC
