// fake_backends.hpp - In-process backends and registrars for tests
// Part of web_compile - Web Asset Compiler

#ifndef WEB_COMPILE_FAKE_BACKENDS_HPP
#define WEB_COMPILE_FAKE_BACKENDS_HPP

#include "backend/compiler_backend.hpp"
#include "vcs/vcs_registrar.hpp"

#include <atomic>
#include <cctype>
#include <mutex>
#include <string>
#include <vector>

using namespace web::compile;

// Upper-cases the source; sources containing "ERROR" fail on line 2
class UpperBackend : public CompilerBackend {
public:
    std::string name() const override { return "upper"; }

    BackendResult compile(const CompileRequest& request) const override {
        calls++;
        if (request.source_text.find("ERROR") != std::string::npos) {
            UnitError error(ErrorKind::COMPILE, "found ERROR");
            error.line = 2;
            error.column = 1;
            return BackendResult::err(error);
        }

        CompileOutput output;
        for (char c : request.source_text) {
            output.text += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        if (request.source_map) {
            output.source_map = "{\"version\":3,\"sources\":[\"" +
                                request.source_path.generic_string() + "\"]}";
        }
        return BackendResult::ok(output);
    }

    mutable std::atomic<int> calls{0};
};

// Returns the source unchanged
class IdentityBackend : public CompilerBackend {
public:
    std::string name() const override { return "identity"; }

    BackendResult compile(const CompileRequest& request) const override {
        CompileOutput output;
        output.text = request.source_text;
        return BackendResult::ok(output);
    }
};

class UnavailableBackend : public IdentityBackend {
public:
    std::string name() const override { return "missing-tool"; }
    bool is_available() const override { return false; }
};

// Records every intent instead of touching git
class RecordingRegistrar : public VcsRegistrar {
public:
    std::string name() const override { return "recording"; }

    RegistrationResult add(const fs::path& path) override {
        std::lock_guard<std::mutex> lock(mutex);
        added.push_back(path.generic_string());
        return RegistrationResult::ok();
    }

    RegistrationResult remove(const fs::path& path) override {
        std::lock_guard<std::mutex> lock(mutex);
        removed.push_back(path.generic_string());
        return RegistrationResult::ok();
    }

    std::mutex mutex;
    std::vector<std::string> added;
    std::vector<std::string> removed;
};

#endif // WEB_COMPILE_FAKE_BACKENDS_HPP
