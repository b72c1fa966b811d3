/**
 * @file language.hpp
 * @brief Closed registry mapping each Language to a sandbox launch specification.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace runbox {

/**
 * @brief Everything the sandbox needs to start one program.
 */
struct LaunchSpec {
    Language language{Language::Python};
    std::vector<std::string> argv;              ///< argv[0] is an absolute path
    std::string source_file;                    ///< Relative to the scratch directory
    std::vector<std::string> readonly_paths;
    uint32_t address_space_factor{0};
};

/**
 * @brief Resolves languages to launch specs. Immutable after construction.
 */
class LanguageRegistry {
public:
    explicit LanguageRegistry(std::map<Language, LanguageConfig> languages);

    /// Rejects languages without a configuration.
    [[nodiscard]] Result<LaunchSpec> resolve(Language language,
                                             const std::filesystem::path& source_dir) const;

    [[nodiscard]] bool supports(Language language) const noexcept;
    [[nodiscard]] std::vector<Language> supported() const;

private:
    std::map<Language, LanguageConfig> languages_;
};

}  // namespace runbox
