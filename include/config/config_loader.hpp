/**
 * config_loader.hpp
 * web-compile.abc -> validated Config
 *
 * The file is parsed with the ABC parser, then every section is checked
 * against the keys it recognizes. Any problem is a ConfigurationError whose
 * message starts with "file:line:column:".
 *
 * The document may also wrap everything in a "web-compile" member, which
 * lets the options live inside a larger shared configuration file.
 *
 * Copyright (c) 2025 Web Compile Project
 */

#ifndef WEB_COMPILE_CONFIG_LOADER_HPP
#define WEB_COMPILE_CONFIG_LOADER_HPP

#include "config/config.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace web::compile {

namespace fs = std::filesystem;

class ConfigLoader {
public:
    static constexpr const char* DEFAULT_FILENAME = "web-compile.abc";
    static constexpr const char* WRAPPER_KEY = "web-compile";

    /**
     * Read and validate a configuration file. The project root becomes the
     * file's directory.
     *
     * @throws ConfigurationError on unreadable files, syntax errors and
     *         invalid values
     */
    static Config load_file(const fs::path& path);

    /**
     * Validate configuration text
     *
     * @param source Configuration text
     * @param config_file Name used in error messages
     * @param project_root Directory relative paths resolve against
     */
    static Config parse(std::string_view source,
                        const fs::path& config_file,
                        const fs::path& project_root);

    /**
     * Run-wide invariants (exit codes, jobs). Called again by the CLI after
     * flags override file values.
     */
    static void validate_run_options(const RunOptions& run);
};

} // namespace web::compile

#endif // WEB_COMPILE_CONFIG_LOADER_HPP
