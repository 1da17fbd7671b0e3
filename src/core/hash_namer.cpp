// hash_namer.cpp - Content-hashed output names and stale sibling pruning
// Part of web_compile - Web Asset Compiler

#include "core/hash_namer.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace web::compile {

// =============================================================================
// Digest
// =============================================================================

std::string HashNamer::content_hash(std::string_view bytes) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    bool ok = EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) == 1
        && EVP_DigestUpdate(ctx, bytes.data(), bytes.size()) == 1
        && EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("MD5 digest computation failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(digest[i]);
    }
    return oss.str();
}

// =============================================================================
// Naming
// =============================================================================

bool HashNamer::is_hashed(const fs::path& output_template) {
    return output_template.filename().string().find(PLACEHOLDER) != std::string::npos;
}

fs::path HashNamer::substitute(const fs::path& output_template, const std::string& digest) {
    std::string filename = output_template.filename().string();
    size_t pos = filename.find(PLACEHOLDER);
    if (pos == std::string::npos) {
        return output_template;
    }
    filename.replace(pos, std::char_traits<char>::length(PLACEHOLDER), digest);
    return output_template.parent_path() / filename;
}

fs::path HashNamer::name_for(const fs::path& output_template, std::string_view bytes) {
    if (!is_hashed(output_template)) {
        return output_template;
    }
    return substitute(output_template, content_hash(bytes));
}

bool HashNamer::matches_template(const std::string& filename,
                                 const std::string& template_filename) {
    size_t pos = template_filename.find(PLACEHOLDER);
    if (pos == std::string::npos) {
        return false;
    }

    const std::string prefix = template_filename.substr(0, pos);
    const std::string suffix = template_filename.substr(
        pos + std::char_traits<char>::length(PLACEHOLDER));

    if (filename.size() != prefix.size() + DIGEST_HEX_LENGTH + suffix.size()) {
        return false;
    }
    if (filename.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    if (filename.compare(prefix.size() + DIGEST_HEX_LENGTH, suffix.size(), suffix) != 0) {
        return false;
    }

    auto first = filename.begin() + static_cast<std::ptrdiff_t>(prefix.size());
    return std::all_of(first, first + DIGEST_HEX_LENGTH, [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

// =============================================================================
// Pruning
// =============================================================================

std::vector<fs::path> HashNamer::find_stale(const fs::path& output_template,
                                            const fs::path& kept) {
    std::vector<fs::path> stale;
    if (!is_hashed(output_template)) {
        return stale;
    }

    fs::path dir = output_template.parent_path();
    fs::path scan_dir = dir.empty() ? fs::path(".") : dir;
    const std::string template_name = output_template.filename().string();
    const std::string kept_name = kept.filename().string();

    std::error_code ec;
    if (!fs::is_directory(scan_dir, ec)) {
        return stale;
    }

    for (const auto& entry : fs::directory_iterator(scan_dir, ec)) {
        if (!entry.is_regular_file(ec)) continue;

        std::string name = entry.path().filename().string();
        if (name == kept_name) continue;
        if (matches_template(name, template_name)) {
            stale.push_back(dir / name);
        }
    }

    std::sort(stale.begin(), stale.end());
    return stale;
}

PruneResult HashNamer::prune_stale(const fs::path& output_template,
                                   const fs::path& kept,
                                   bool dry_run) {
    PruneResult result;

    for (const auto& path : find_stale(output_template, kept)) {
        if (dry_run) {
            result.removed.push_back(path);
            continue;
        }

        std::error_code ec;
        if (fs::remove(path, ec)) {
            result.removed.push_back(path);
        } else if (ec) {
            result.errors.push_back("Failed to remove " + path.string() + ": " + ec.message());
        }
    }

    return result;
}

} // namespace web::compile
