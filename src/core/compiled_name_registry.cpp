// compiled_name_registry.cpp - Source path -> resolved output path table
// Part of web_compile - Web Asset Compiler

#include "core/compiled_name_registry.hpp"

#include <mutex>

namespace web::compile {

std::string CompiledNameRegistry::normalize_key(const fs::path& source) {
    std::string key = source.lexically_normal().generic_string();
    while (key.size() > 2 && key.compare(0, 2, "./") == 0) {
        key.erase(0, 2);
    }
    return key;
}

void CompiledNameRegistry::add(const fs::path& source, const fs::path& resolved_output) {
    std::unique_lock lock(mutex_);
    if (sealed_) {
        throw std::logic_error(
            "Compiled name registered after the template stage started: " + source.string());
    }
    entries_[normalize_key(source)] = resolved_output.lexically_normal();
}

std::optional<fs::path> CompiledNameRegistry::find(const fs::path& source) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(normalize_key(source));
    if (it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

fs::path CompiledNameRegistry::lookup(const fs::path& source) const {
    auto resolved = find(source);
    if (!resolved) {
        throw DanglingReferenceError(source.string());
    }
    return *resolved;
}

void CompiledNameRegistry::seal() {
    std::unique_lock lock(mutex_);
    sealed_ = true;
}

bool CompiledNameRegistry::sealed() const {
    std::shared_lock lock(mutex_);
    return sealed_;
}

size_t CompiledNameRegistry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

} // namespace web::compile
