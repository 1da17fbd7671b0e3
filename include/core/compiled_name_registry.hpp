#ifndef WEB_COMPILE_COMPILED_NAME_REGISTRY_HPP
#define WEB_COMPILE_COMPILED_NAME_REGISTRY_HPP

// compiled_name_registry.hpp - Source path -> resolved output path table
// Part of web_compile - Web Asset Compiler
//
// One registry per pipeline run. Style and script units add entries as they
// succeed; the orchestrator seals the registry before the template stage,
// which only reads from it.
//
// Thread-safe: shared_mutex, so a stage's workers may add concurrently

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace web::compile {

namespace fs = std::filesystem;

// A template referenced a source that no earlier stage compiled
class DanglingReferenceError : public std::runtime_error {
public:
    explicit DanglingReferenceError(const std::string& source)
        : std::runtime_error("No compiled path: " + source), source_(source) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

class CompiledNameRegistry {
public:
    CompiledNameRegistry() = default;

    CompiledNameRegistry(const CompiledNameRegistry&) = delete;
    CompiledNameRegistry& operator=(const CompiledNameRegistry&) = delete;

    // Record a compiled source. Throws std::logic_error once sealed.
    void add(const fs::path& source, const fs::path& resolved_output);

    std::optional<fs::path> find(const fs::path& source) const;

    // Like find, but a missing entry throws DanglingReferenceError
    fs::path lookup(const fs::path& source) const;

    // Close the table for writing (template stage barrier)
    void seal();
    bool sealed() const;

    size_t size() const;

    // "./src//a.scss" and "src/a.scss" share one key
    static std::string normalize_key(const fs::path& source);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, fs::path> entries_;
    bool sealed_ = false;
};

} // namespace web::compile

#endif // WEB_COMPILE_COMPILED_NAME_REGISTRY_HPP
