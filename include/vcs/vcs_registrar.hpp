#ifndef WEB_COMPILE_VCS_REGISTRAR_HPP
#define WEB_COMPILE_VCS_REGISTRAR_HPP

// vcs_registrar.hpp - Applies add/remove intents for outputs to the VCS index
// Part of web_compile - Web Asset Compiler
//
// The StageRunner emits an "add" intent for every output it creates and a
// "remove" intent for every stale sibling it prunes. Registration failures
// are warnings: the file on disk is already correct.

#include "process/process_runner.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace web::compile {

namespace fs = std::filesystem;

struct Config;

struct RegistrationResult {
    bool success;
    std::string error;

    static RegistrationResult ok() { return {true, ""}; }
    static RegistrationResult err(std::string msg) { return {false, std::move(msg)}; }
};

class VcsRegistrar {
public:
    virtual ~VcsRegistrar() = default;

    virtual std::string name() const = 0;

    // Paths are relative to the project root
    virtual RegistrationResult add(const fs::path& path) = 0;
    virtual RegistrationResult remove(const fs::path& path) = 0;
};

// git_add = false
class NullRegistrar : public VcsRegistrar {
public:
    std::string name() const override { return "none"; }
    RegistrationResult add(const fs::path&) override { return RegistrationResult::ok(); }
    RegistrationResult remove(const fs::path&) override { return RegistrationResult::ok(); }
};

// Stages changes with the git CLI. Calls are serialized: concurrent git
// processes would contend for index.lock.
class GitIndex : public VcsRegistrar {
public:
    explicit GitIndex(fs::path project_root, std::string git = "git");

    std::string name() const override { return "git"; }
    RegistrationResult add(const fs::path& path) override;
    RegistrationResult remove(const fs::path& path) override;

    // Nearest directory at or above `start` containing .git
    static std::optional<fs::path> find_repository(const fs::path& start);

private:
    fs::path project_root_;
    ProcessRunner git_;
    std::mutex mutex_;

    RegistrationResult run(const std::vector<std::string>& args);
};

// GitIndex when config.run.git_add is set, NullRegistrar otherwise.
// Throws ConfigurationError when git_add is set outside a repository.
std::unique_ptr<VcsRegistrar> make_registrar(const Config& config);

} // namespace web::compile

#endif // WEB_COMPILE_VCS_REGISTRAR_HPP
