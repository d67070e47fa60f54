#include "core/types.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace vecture {

std::optional<Category> parse_category(std::string_view name) {
    for (const auto category : kAllCategories) {
        if (name == category_to_string(category)) {
            return category;
        }
    }
    return std::nullopt;
}

std::optional<Category> parse_class_name(std::string_view name) {
    static const std::unordered_map<std::string, Category> lookup = {
        {"ipv4",                  Category::IPV4},
        {"ip",                    Category::IPV4},
        {"date",                  Category::DATE},
        {"email",                 Category::EMAIL},
        {"custom",                Category::CUSTOM_TERM},
        {"customterm",            Category::CUSTOM_TERM},
        {"capitals",              Category::CAPITALIZED_HEURISTIC},
        {"capitalizedheuristic",  Category::CAPITALIZED_HEURISTIC},
    };

    const auto it = lookup.find(utils::to_lower(name));
    if (it != lookup.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<RedactionStyle> parse_style(std::string_view name) {
    static const std::unordered_map<std::string, RedactionStyle> lookup = {
        {"classic",       RedactionStyle::CLASSIC},
        {"blackout",      RedactionStyle::BLACKOUT},
        {"noise",         RedactionStyle::NOISE},
        {"vecture_noise", RedactionStyle::NOISE},
    };

    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // namespace vecture
