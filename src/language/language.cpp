/**
 * @file language.cpp
 * @brief LanguageRegistry implementation.
 */

#include "language/language.hpp"

namespace runbox {

namespace {
constexpr std::string_view kSourcePlaceholder = "{source}";
}

LanguageRegistry::LanguageRegistry(std::map<Language, LanguageConfig> languages)
    : languages_(std::move(languages)) {}

Result<LaunchSpec> LanguageRegistry::resolve(Language language,
                                             const std::filesystem::path& source_dir) const {
    auto it = languages_.find(language);
    if (it == languages_.end()) {
        return Error{ErrorCode::UnsupportedLanguage,
                     "Language not enabled: " + std::string{to_string(language)}};
    }

    const auto& cfg = it->second;
    if (cfg.command.empty()) {
        return Error{ErrorCode::Config,
                     "Language has no command: " + std::string{to_string(language)}};
    }

    LaunchSpec spec;
    spec.language = language;
    spec.source_file = cfg.source_file;
    spec.readonly_paths = cfg.readonly_paths;
    spec.address_space_factor = cfg.address_space_factor;
    spec.argv.reserve(cfg.command.size());

    const auto source_path = (source_dir / cfg.source_file).string();
    for (const auto& arg : cfg.command) {
        spec.argv.push_back(arg == kSourcePlaceholder ? source_path : arg);
    }
    return spec;
}

bool LanguageRegistry::supports(Language language) const noexcept {
    return languages_.contains(language);
}

std::vector<Language> LanguageRegistry::supported() const {
    std::vector<Language> out;
    out.reserve(languages_.size());
    for (const auto& [lang, cfg] : languages_) {
        out.push_back(lang);
    }
    return out;
}

}  // namespace runbox
