// vcs_registrar.cpp - Applies add/remove intents for outputs to the VCS index
// Part of web_compile - Web Asset Compiler

#include "vcs/vcs_registrar.hpp"
#include "config/config.hpp"

#include <stdexcept>
#include <system_error>

namespace web::compile {

GitIndex::GitIndex(fs::path project_root, std::string git)
    : project_root_(std::move(project_root)), git_(std::move(git)) {}

std::optional<fs::path> GitIndex::find_repository(const fs::path& start) {
    std::error_code ec;
    fs::path dir = fs::absolute(start, ec);
    if (ec) {
        return std::nullopt;
    }
    dir = dir.lexically_normal();

    while (true) {
        // .git is a directory, or a file in worktrees and submodules
        if (fs::exists(dir / ".git", ec)) {
            return dir;
        }
        fs::path parent = dir.parent_path();
        if (parent.empty() || parent == dir) {
            return std::nullopt;
        }
        dir = parent;
    }
}

RegistrationResult GitIndex::run(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        ProcessRunner::Result result = git_.run(args, project_root_);
        if (!result.success()) {
            std::string message = result.stderr_output;
            size_t end = message.find_last_not_of(" \t\r\n");
            message.erase(end == std::string::npos ? 0 : end + 1);
            if (message.empty()) {
                message = "git exited with code " + std::to_string(result.exit_code);
            }
            return RegistrationResult::err(message);
        }
        return RegistrationResult::ok();
    } catch (const std::runtime_error& e) {
        return RegistrationResult::err(e.what());
    }
}

RegistrationResult GitIndex::add(const fs::path& path) {
    return run({"add", "--", path.generic_string()});
}

RegistrationResult GitIndex::remove(const fs::path& path) {
    return run({"rm", "--cached", "--quiet", "--ignore-unmatch", "--", path.generic_string()});
}

std::unique_ptr<VcsRegistrar> make_registrar(const Config& config) {
    if (!config.run.git_add) {
        return std::make_unique<NullRegistrar>();
    }

    if (!GitIndex::find_repository(config.project_root)) {
        throw ConfigurationError(
            "git_add is enabled but " + config.project_root.string() +
            " is not inside a git repository (use --no-git-add)");
    }
    return std::make_unique<GitIndex>(config.project_root);
}

} // namespace web::compile
