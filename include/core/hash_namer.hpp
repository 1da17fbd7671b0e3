#ifndef WEB_COMPILE_HASH_NAMER_HPP
#define WEB_COMPILE_HASH_NAMER_HPP

// hash_namer.hpp - Content-hashed output names and stale sibling pruning
// Part of web_compile - Web Asset Compiler
//
// Output templates carry a [hash] placeholder in their filename component:
//   dist/css/main.[hash].css  ->  dist/css/main.3f2a...9c.css
//
// The digest is MD5 (OpenSSL EVP) over the final output bytes, rendered as
// 32 lower-case hex characters. Stale siblings are files in the same
// directory whose name matches the template with exactly 32 hex digits in
// place of the placeholder.

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace web::compile {

namespace fs = std::filesystem;

struct PruneResult {
    std::vector<fs::path> removed;    // deleted (or would be, in a dry run)
    std::vector<std::string> errors;  // deletions that failed

    bool ok() const { return errors.empty(); }
};

class HashNamer {
public:
    static constexpr const char* PLACEHOLDER = "[hash]";
    static constexpr size_t DIGEST_HEX_LENGTH = 32;

    // MD5 hex digest of a byte buffer
    static std::string content_hash(std::string_view bytes);

    // True when the template's filename contains the placeholder
    static bool is_hashed(const fs::path& output_template);

    // Substitute the digest of `bytes` into the filename. Templates without
    // a placeholder are returned unchanged.
    static fs::path name_for(const fs::path& output_template, std::string_view bytes);

    // Same as name_for with a precomputed digest
    static fs::path substitute(const fs::path& output_template, const std::string& digest);

    // Does `filename` match the template filename with some digest in place?
    static bool matches_template(const std::string& filename,
                                 const std::string& template_filename);

    // Hashed siblings of `kept`, sorted by name. Empty for unhashed templates
    // or a missing directory.
    static std::vector<fs::path> find_stale(const fs::path& output_template,
                                            const fs::path& kept);

    // Delete every stale sibling. With dry_run set the candidates are only
    // reported. Running twice leaves the directory in the same state.
    static PruneResult prune_stale(const fs::path& output_template,
                                   const fs::path& kept,
                                   bool dry_run = false);
};

} // namespace web::compile

#endif // WEB_COMPILE_HASH_NAMER_HPP
