#include "repro/archive.hpp"
#include "repro/platform.hpp"

#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

#include <sys/wait.h>
#include <unistd.h>

namespace repro {

namespace {

constexpr int EXIT_COMMAND_NOT_FOUND = 127;

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

// ============================================================================
// CommandExtractor
// ============================================================================

CommandExtractor::CommandExtractor(std::string format, std::vector<std::string> argv_template)
    : format_(std::move(format)), argv_template_(std::move(argv_template)) {}

std::vector<std::string> CommandExtractor::build_argv(const std::string& archive_path,
                                                      const std::string& dest_dir) const {
    std::vector<std::string> argv = argv_template_;
    for (auto& arg : argv) {
        replace_all(arg, "{archive}", archive_path);
        replace_all(arg, "{dir}", dest_dir);
    }
    return argv;
}

ExtractResult CommandExtractor::extract(const std::string& archive_path,
                                        const std::string& dest_dir) const {
    ExtractResult result;

    if (argv_template_.empty()) {
        result.error = format_ + ": empty extractor command";
        return result;
    }
    if (!is_regular_file(archive_path)) {
        result.error = "archive not found: " + archive_path;
        return result;
    }
    if (!create_directories(dest_dir)) {
        result.error = "failed to create directory: " + dest_dir;
        return result;
    }

    auto argv_strings = build_argv(archive_path, dest_dir);

    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    spdlog::debug("running {} extractor: {}", format_, argv_strings[0]);

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process: keep stdout clean for the report
        dup2(STDERR_FILENO, STDOUT_FILENO);
        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        _exit(EXIT_COMMAND_NOT_FOUND);
    }

    int status;
    if (waitpid(pid, &status, 0) == -1) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == EXIT_COMMAND_NOT_FOUND) {
            result.error = "extraction tool not available: " + argv_strings[0];
            return result;
        }
        if (code != 0) {
            result.error = argv_strings[0] + " exited with status " + std::to_string(code);
            return result;
        }
    } else if (WIFSIGNALED(status)) {
        result.error = argv_strings[0] + " killed by signal " + std::to_string(WTERMSIG(status));
        return result;
    } else {
        result.error = argv_strings[0] + " terminated abnormally";
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Extractor Lookup
// ============================================================================

const ExtractorTable& builtin_extractor_templates() {
    static const ExtractorTable templates = {
        {"jimage", {"jimage", "extract", "--dir", "{dir}", "{archive}"}},
        {"zip", {"unzip", "-q", "-o", "{archive}", "-d", "{dir}"}},
        {"jar", {"unzip", "-q", "-o", "{archive}", "-d", "{dir}"}},
    };
    return templates;
}

std::unique_ptr<ArchiveExtractor> make_extractor(const std::string& format,
                                                 const ExtractorTable& custom) {
    auto it = custom.find(format);
    if (it != custom.end()) {
        return std::unique_ptr<ArchiveExtractor>(new CommandExtractor(format, it->second));
    }

    if (format == "tar.gz" || format == "tgz") {
        return std::unique_ptr<ArchiveExtractor>(new TarGzExtractor());
    }

    const auto& builtins = builtin_extractor_templates();
    auto builtin = builtins.find(format);
    if (builtin != builtins.end()) {
        return std::unique_ptr<ArchiveExtractor>(new CommandExtractor(format, builtin->second));
    }

    return nullptr;
}

bool is_known_format(const std::string& format, const ExtractorTable& custom) {
    return custom.count(format) > 0 || format == "tar.gz" || format == "tgz" ||
           builtin_extractor_templates().count(format) > 0;
}

} // namespace repro
