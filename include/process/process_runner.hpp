#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace web::compile {

/**
 * ProcessRunner - Spawns an external tool and captures its output
 *
 * Responsibilities:
 * - Locate the program (absolute path or bare name looked up in PATH)
 * - Spawn it with fork/exec, optionally inside a working directory
 * - Capture stdout/stderr through non-blocking pipes
 * - Track wall time for verbose reporting
 *
 * Used by the style/script backends (sassc, esbuild) and by GitIndex.
 *
 * Platform Support: POSIX (fork/exec)
 */
class ProcessRunner {
public:
    /**
     * Result of one process invocation
     */
    struct Result {
        int exit_code;                          // 0 = success, 128+N = killed by signal N
        std::string stdout_output;
        std::string stderr_output;
        std::chrono::milliseconds duration;
        bool stdout_truncated = false;          // capture hit OUTPUT_LIMIT
        bool stderr_truncated = false;

        bool success() const { return exit_code == 0; }
    };

    // Per-stream capture cap
    static constexpr size_t OUTPUT_LIMIT = 10 * 1024 * 1024;

    // Exit code reported by the child when exec itself fails
    static constexpr int EXEC_FAILED = 127;

    /**
     * @param program Absolute/relative path or bare name resolved through PATH
     */
    explicit ProcessRunner(std::string program);

    /**
     * Run the program with `args` (argv[0] is added automatically)
     *
     * @param args Arguments after the program name
     * @param working_dir Directory for the child; empty = inherit
     * @return Result with exit code, captured output and timing
     * @throws std::runtime_error on pipe/fork failure (not on tool errors)
     */
    Result run(const std::vector<std::string>& args,
               const std::filesystem::path& working_dir = {}) const;

    /**
     * Test if the program exists and is executable
     */
    bool is_available() const;

    const std::string& program() const { return program_; }

    /**
     * Resolve a program name the way execvp does
     *
     * Names containing '/' are checked directly; bare names are searched
     * in each PATH entry.
     */
    static std::optional<std::filesystem::path> find_program(const std::string& program);

private:
    std::string program_;

    static bool is_executable_file(const std::filesystem::path& path);
};

} // namespace web::compile
