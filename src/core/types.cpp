/**
 * @file types.cpp
 * @brief Language tag parsing.
 */

#include "core/types.hpp"

namespace runbox {

std::optional<Language> parse_language(std::string_view tag) noexcept {
    if (tag == "python" || tag == "python3" || tag == "py") return Language::Python;
    if (tag == "javascript" || tag == "js" || tag == "node") return Language::JavaScript;
    if (tag == "shell" || tag == "sh") return Language::Shell;
    return std::nullopt;
}

}  // namespace runbox
