#include <catch2/catch.hpp>
#include <wharf/git.hpp>
#include <wharf/remote.hpp>
#include "fixtures.hpp"

using namespace wharf;

// ===== parse_remote_verbose() =====

TEST_CASE("parse_remote_verbose collapses fetch and push", "[git]") {
    auto remotes = parse_remote_verbose(
        "origin\tgit@github.com:acme/widgets.git (fetch)\n"
        "origin\tgit@github.com:acme/widgets.git (push)\n"
        "local\t/srv/git/widgets (fetch)\n"
        "local\t/srv/git/widgets (push)\n");
    REQUIRE(remotes.size() == 2);
    REQUIRE(remotes[0].name == "origin");
    REQUIRE(remotes[0].url == "git@github.com:acme/widgets.git");
    REQUIRE(remotes[0].canonical == "github.com/acme/widgets");
    REQUIRE(remotes[1].name == "local");
    REQUIRE(remotes[1].canonical == "/srv/git/widgets");
}

// ===== GitCli against real repositories =====

TEST_CASE("git version is supported", "[git]") {
    GitCli git;
    auto v = git.check_version();
    REQUIRE(v.is_ok());
    REQUIRE_FALSE(v.value().empty());
}

TEST_CASE("toplevel of root, subdirectory and non-repository", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");
    fs::create_directories(fs::path(origin) / "sub");

    auto top = git.toplevel(origin);
    REQUIRE(top.is_ok());
    REQUIRE(top.value() == origin);

    auto sub = git.toplevel((fs::path(origin) / "sub").string());
    REQUIRE(sub.is_ok());
    REQUIRE(sub.value() == origin);

    fs::create_directories(gf.td.path / "plain");
    auto plain = git.toplevel((gf.td.path / "plain").string());
    REQUIRE(plain.is_err());
    REQUIRE(plain.error().code == WharfError::NotARepository);
}

TEST_CASE("head on a branch and detached", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");
    auto first = gf.rev_parse(origin, "HEAD");

    auto h = git.head(origin);
    REQUIRE(h.is_ok());
    REQUIRE(h.value().branch == std::optional<std::string>("main"));
    REQUIRE(h.value().commit == first);
    REQUIRE_FALSE(h.value().detached());

    gf.commit(origin, "a.txt", "a\n");
    gf.git_ok(origin, {"checkout", "-q", first});
    auto d = git.head(origin);
    REQUIRE(d.is_ok());
    REQUIRE(d.value().detached());
    REQUIRE(d.value().commit == first);
}

TEST_CASE("head of a repository without commits", "[git]") {
    GitFixture gf;
    GitCli git;
    auto empty = gf.init_repo("empty");

    auto h = git.head(empty);
    REQUIRE(h.is_ok());
    REQUIRE(h.value().branch == std::optional<std::string>("main"));
    REQUIRE(h.value().commit.empty());
}

TEST_CASE("upstream_branch of a clone", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");
    auto clone = gf.clone(origin, "clones/widgets");

    auto up = git.upstream_branch(clone, "main");
    REQUIRE(up.is_ok());
    REQUIRE(up.value() == "main");

    gf.git_ok(clone, {"checkout", "-q", "-b", "topic"});
    auto none = git.upstream_branch(clone, "topic");
    REQUIRE(none.is_ok());
    REQUIRE(none.value().empty());
}

TEST_CASE("upstream_remote names the tracked remote", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");
    auto clone = gf.clone(origin, "clones/widgets");

    auto up = git.upstream_remote(clone, "main");
    REQUIRE(up.is_ok());
    REQUIRE(up.value() == "origin");

    gf.git_ok(clone, {"checkout", "-q", "-b", "local-topic", "--track", "main"});
    auto local = git.upstream_remote(clone, "local-topic");
    REQUIRE(local.is_ok());
    REQUIRE(local.value() == ".");

    gf.git_ok(clone, {"checkout", "-q", "-b", "loose", "--no-track"});
    auto none = git.upstream_remote(clone, "loose");
    REQUIRE(none.is_ok());
    REQUIRE(none.value().empty());
}

TEST_CASE("remotes of a clone", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");
    auto clone = gf.clone(origin, "clones/widgets");
    gf.git_ok(clone, {"remote", "add", "upstream", "https://github.com/acme/widgets.git"});

    auto remotes = git.remotes(clone);
    REQUIRE(remotes.is_ok());
    REQUIRE(remotes.value().size() == 2);

    bool saw_origin = false, saw_upstream = false;
    for (const auto& r : remotes.value()) {
        if (r.name == "origin") {
            saw_origin = true;
            REQUIRE(r.url == origin);
            REQUIRE(r.canonical == canonical_remote(origin).value());
        }
        if (r.name == "upstream") {
            saw_upstream = true;
            REQUIRE(r.canonical == "github.com/acme/widgets");
        }
    }
    REQUIRE(saw_origin);
    REQUIRE(saw_upstream);
}

TEST_CASE("resolve_commit and has_commit", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");
    auto head = gf.rev_parse(origin, "HEAD");

    auto r = git.resolve_commit(origin, "main");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == head);

    auto missing = git.resolve_commit(origin, "no-such-branch");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == WharfError::NotFound);

    REQUIRE(git.has_commit(origin, head).value());
    REQUIRE_FALSE(git.has_commit(origin, std::string(40, 'd')).value());
}

TEST_CASE("fetch a ref and a missing ref", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");
    auto clone = gf.clone(origin, "clones/widgets");
    auto tip = gf.commit(origin, "b.txt", "b\n");

    REQUIRE(git.fetch(clone, origin, std::string("main")).is_ok());
    REQUIRE(git.resolve_commit(clone, "FETCH_HEAD").value() == tip);

    auto missing = git.fetch(clone, origin, std::string("does-not-exist"));
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == WharfError::RemoteRefNotFound);

    REQUIRE(git.fetch(clone, "origin").is_ok());
    REQUIRE(git.has_commit(clone, tip).value());
}

TEST_CASE("is_ancestor and merge_ff_only", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");
    auto base = gf.rev_parse(origin, "HEAD");
    auto clone = gf.clone(origin, "clones/widgets");
    auto tip = gf.commit(origin, "c.txt", "c\n");
    REQUIRE(git.fetch(clone, "origin").is_ok());

    REQUIRE(git.is_ancestor(clone, base, tip).value());
    REQUIRE_FALSE(git.is_ancestor(clone, tip, base).value());

    REQUIRE(git.merge_ff_only(clone, tip).is_ok());
    REQUIRE(gf.rev_parse(clone, "HEAD") == tip);

    // Diverge locally, then a fast-forward is impossible
    auto other = gf.commit(origin, "d.txt", "d\n");
    gf.commit(clone, "local.txt", "local\n");
    REQUIRE(git.fetch(clone, "origin").is_ok());
    auto ff = git.merge_ff_only(clone, other);
    REQUIRE(ff.is_err());
    REQUIRE(ff.error().code == WharfError::NonFastForward);
}

TEST_CASE("is_ancestor with an unknown commit is an error", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");
    auto r = git.is_ancestor(origin, "HEAD", std::string(40, 'e'));
    REQUIRE(r.is_err());
}

TEST_CASE("branches, checkout and reset", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");
    auto base = gf.rev_parse(origin, "HEAD");
    auto tip = gf.commit(origin, "e.txt", "e\n");

    REQUIRE_FALSE(git.branch_exists(origin, "release").value());
    REQUIRE(git.create_branch(origin, "release", base).is_ok());
    REQUIRE(git.branch_exists(origin, "release").value());

    REQUIRE(git.checkout(origin, "release").is_ok());
    REQUIRE(gf.branch(origin) == "release");
    REQUIRE(gf.rev_parse(origin, "HEAD") == base);

    REQUIRE(git.reset_hard(origin, tip).is_ok());
    REQUIRE(gf.rev_parse(origin, "HEAD") == tip);
    REQUIRE(gf.branch(origin) == "release");

    auto bad = git.checkout(origin, "nowhere");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == WharfError::RemoteRefNotFound);
}

TEST_CASE("stash with and without local changes", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");

    auto clean = git.stash(origin, "WIP on main to checkout topic");
    REQUIRE(clean.is_ok());
    REQUIRE_FALSE(clean.value());

    gf.td.write_file("origin/widgets/README", "edited\n");
    auto dirty = git.stash(origin, "WIP on main to checkout topic");
    REQUIRE(dirty.is_ok());
    REQUIRE(dirty.value());

    auto list = gf.git_ok(origin, {"stash", "list"});
    REQUIRE(list.find("WIP on main to checkout topic") != std::string::npos);
    REQUIRE(gf.git(origin, {"diff", "--quiet"}).exit_code == 0);
}

TEST_CASE("clone success and failure", "[git]") {
    GitFixture gf;
    GitCli git;
    auto origin = gf.make_origin("widgets");

    auto dest = (gf.td.path / "clones" / "w").string();
    REQUIRE(git.clone(origin, dest).is_ok());
    REQUIRE(fs::exists(fs::path(dest) / "README"));

    auto fail = git.clone((gf.td.path / "no-such-origin").string(),
                          (gf.td.path / "clones" / "x").string());
    REQUIRE(fail.is_err());
    REQUIRE(fail.error().code == WharfError::CloneFailed);
}

TEST_CASE("trace callback sees every invocation", "[git]") {
    GitFixture gf;
    GitCli git;
    GitTrace trace;
    trace.attach(git);
    auto origin = gf.make_origin("widgets");

    REQUIRE(git.head(origin).is_ok());
    REQUIRE(git.stash(origin, "nothing").is_ok());

    REQUIRE(trace.count("symbolic-ref") == 1);
    REQUIRE(trace.count("rev-parse") == 1);
    REQUIRE(trace.count("stash") == 1);
    REQUIRE(trace.mutating() == 1);
}
