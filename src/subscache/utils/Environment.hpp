#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SC {

// An unset variable is false; a set but empty one is true.
auto parse_truthy(char const* value) -> bool;
auto env_truthy(char const* name) -> bool;
auto env_size(char const* name) -> std::optional<std::size_t>;
auto env_list(char const* name) -> std::vector<std::string>;

auto split_list(std::string_view text, char delimiter = ',') -> std::vector<std::string>;

} // namespace SC
