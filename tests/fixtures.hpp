#pragma once

#include <catch2/catch.hpp>
#include <wharf/git.hpp>
#include <wharf/process.hpp>
#include <wharf/prompter.hpp>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// RAII temp directory. The path has symlinks resolved and no hidden
// component, so crawls and toplevel comparisons see it as-is.
// ---------------------------------------------------------------------------

struct TempDir {
    fs::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        fs::path base = fs::weakly_canonical(fs::temp_directory_path());
        path = base / ("wharf_test_" + std::to_string(getpid()) + "_" +
                       std::to_string(counter++));
        std::error_code ec;
        fs::remove_all(path, ec);
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string str() const { return path.string(); }

    void write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }
};

// ---------------------------------------------------------------------------
// Real git repositories: an "origin" per remote plus clones of it
// ---------------------------------------------------------------------------

struct GitFixture {
    TempDir td;

    GitFixture() {
        // Commits made by the library (stash) need an identity too
        setenv("GIT_AUTHOR_NAME", "Test", 1);
        setenv("GIT_AUTHOR_EMAIL", "test@test.com", 1);
        setenv("GIT_COMMITTER_NAME", "Test", 1);
        setenv("GIT_COMMITTER_EMAIL", "test@test.com", 1);
    }

    wharf::CommandResult git(const std::string& dir, std::vector<std::string> args) {
        args.insert(args.begin(), "git");
        auto r = wharf::run_command(args, dir);
        REQUIRE(r.is_ok());
        return r.value();
    }

    // Run git, require success, return stdout without the trailing newline
    std::string git_ok(const std::string& dir, std::vector<std::string> args) {
        auto r = git(dir, args);
        INFO("git stderr: " << r.stderr_str);
        REQUIRE(r.exit_code == 0);
        std::string out = r.stdout_str;
        while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
        return out;
    }

    std::string init_repo(const std::string& rel) {
        fs::path dir = td.path / rel;
        fs::create_directories(dir);
        git_ok(dir.string(), {"init", "-q"});
        git_ok(dir.string(), {"symbolic-ref", "HEAD", "refs/heads/main"});
        return dir.string();
    }

    // Write a file and commit it; returns the new HEAD commit
    std::string commit(const std::string& dir, const std::string& file,
                       const std::string& content, const std::string& msg = "update") {
        {
            std::ofstream f(fs::path(dir) / file);
            f << content;
        }
        git_ok(dir, {"add", file});
        git_ok(dir, {"commit", "-q", "-m", msg});
        return rev_parse(dir, "HEAD");
    }

    std::string rev_parse(const std::string& dir, const std::string& ref) {
        return git_ok(dir, {"rev-parse", ref});
    }

    // "" when detached
    std::string branch(const std::string& dir) {
        auto r = git(dir, {"symbolic-ref", "-q", "--short", "HEAD"});
        if (r.exit_code != 0) return "";
        std::string out = r.stdout_str;
        while (!out.empty() && out.back() == '\n') out.pop_back();
        return out;
    }

    // Repository acting as the remote, with one commit on main
    std::string make_origin(const std::string& name) {
        std::string dir = init_repo("origin/" + name);
        commit(dir, "README", "hello\n", "initial");
        return dir;
    }

    std::string clone(const std::string& origin, const std::string& rel) {
        fs::path dest = td.path / rel;
        fs::create_directories(dest.parent_path());
        git_ok(td.str(), {"clone", "-q", origin, dest.string()});
        return dest.string();
    }
};

// ---------------------------------------------------------------------------
// A `git` script placed first on PATH for the fixture's lifetime. The
// script handles `git clone -q <url> <dest>` with `clone_body` ($3 is the
// URL, $4 the destination, $REAL_GIT the real binary) and passes every
// other command through.
// ---------------------------------------------------------------------------

struct ScriptedGitOnPath {
    TempDir bin;
    std::string saved_path;

    explicit ScriptedGitOnPath(const std::string& clone_body) {
        auto which = wharf::run_command({"sh", "-c", "command -v git"});
        REQUIRE(which.is_ok());
        std::string real_git = which.value().stdout_str;
        while (!real_git.empty() && real_git.back() == '\n') real_git.pop_back();
        REQUIRE_FALSE(real_git.empty());

        bin.write_file("git",
            "#!/bin/sh\n"
            "REAL_GIT='" + real_git + "'\n"
            "if [ \"$1\" = clone ]; then\n" + clone_body + "\nfi\n"
            "exec \"$REAL_GIT\" \"$@\"\n");
        fs::permissions(bin.path / "git", fs::perms::owner_all);

        const char* path = std::getenv("PATH");
        saved_path = path ? path : "";
        setenv("PATH", (bin.str() + ":" + saved_path).c_str(), 1);
    }

    ~ScriptedGitOnPath() {
        setenv("PATH", saved_path.c_str(), 1);
    }
};

// ---------------------------------------------------------------------------
// Prompter answering from a script, recording every prompt
// ---------------------------------------------------------------------------

class ScriptedPrompter : public wharf::Prompter {
public:
    struct Call {
        std::vector<wharf::PickItem> items;
        std::string placeholder;
    };

    std::vector<std::optional<size_t>> answers;   // consumed front to back
    std::vector<Call> calls;

    std::optional<size_t> present(const std::vector<wharf::PickItem>& items,
                                  const std::string& placeholder) override {
        calls.push_back(Call{items, placeholder});
        if (answers.empty()) return std::nullopt;
        auto answer = answers.front();
        answers.erase(answers.begin());
        return answer;
    }
};

// ---------------------------------------------------------------------------
// Records git invocations made through a GitCli
// ---------------------------------------------------------------------------

struct GitTrace {
    std::mutex mutex;
    std::vector<std::vector<std::string>> calls;

    void attach(wharf::GitCli& git) {
        git.set_trace([this](const std::vector<std::string>& argv) {
            std::lock_guard<std::mutex> lock(mutex);
            calls.push_back(argv);
        });
    }

    size_t count(const std::string& subcommand) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t n = 0;
        for (const auto& c : calls) {
            if (!c.empty() && c[0] == subcommand) ++n;
        }
        return n;
    }

    // Calls that change a working copy or its refs
    size_t mutating() {
        size_t n = 0;
        for (const char* sub : {"fetch", "merge", "checkout", "branch", "stash", "reset", "clone"}) {
            n += count(sub);
        }
        return n;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        calls.clear();
    }
};
