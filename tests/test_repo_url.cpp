#include "errors.hpp"
#include "repo_url.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace gri;

TEST_CASE("shorthand expands to the primary provider", "[repo_url]") {
  RepoReference ref = normalize_repo_url("octocat/hello-world");
  REQUIRE(ref.owner == "octocat");
  REQUIRE(ref.repo_name == "hello-world");
  REQUIRE(ref.provider == Provider::GitHub);
  REQUIRE(ref.normalized_url == "https://github.com/octocat/hello-world");
  REQUIRE(ref.parsed_url == "https://github.com/octocat/hello-world");
  REQUIRE(ref.original_input == "octocat/hello-world");
  REQUIRE(!ref.branch);
  REQUIRE(!ref.commit);

  RepoReference dotted = normalize_repo_url("my.org/site.github.io");
  REQUIRE(dotted.owner == "my.org");
  REQUIRE(dotted.repo_name == "site.github.io");
}

TEST_CASE("git suffix and trailing segments are dropped", "[repo_url]") {
  RepoReference ref = normalize_repo_url("https://github.com/owner/repo.git");
  REQUIRE(ref.repo_name == "repo");
  REQUIRE(ref.normalized_url == "https://github.com/owner/repo");

  RepoReference deep =
      normalize_repo_url("https://github.com/owner/repo/issues/42");
  REQUIRE(deep.normalized_url == "https://github.com/owner/repo");
}

TEST_CASE("repeated git suffixes are all dropped", "[repo_url]") {
  RepoReference ref = normalize_repo_url("o/r.git.git");
  REQUIRE(ref.repo_name == "r");
  REQUIRE(ref.normalized_url == "https://github.com/o/r");
  REQUIRE(normalize_repo_url(ref.normalized_url).normalized_url ==
          ref.normalized_url);
}

TEST_CASE("branch and commit are extracted", "[repo_url]") {
  RepoReference tree =
      normalize_repo_url("https://github.com/owner/repo/tree/main");
  REQUIRE(tree.branch == std::optional<std::string>("main"));
  REQUIRE(!tree.commit);
  REQUIRE(tree.normalized_url == "https://github.com/owner/repo");

  RepoReference release =
      normalize_repo_url("https://github.com/owner/repo/tree/release-1.2_x");
  REQUIRE(release.branch == std::optional<std::string>("release-1.2_x"));

  RepoReference commit =
      normalize_repo_url("https://github.com/owner/repo/commit/ABC123");
  REQUIRE(commit.commit == std::optional<std::string>("abc123"));
  REQUIRE(!commit.branch);
}

TEST_CASE("first tree and commit segments win in any order", "[repo_url]") {
  RepoReference both = normalize_repo_url(
      "https://github.com/owner/repo/tree/first/x/tree/second/commit/ABCDEF");
  REQUIRE(both.branch == std::optional<std::string>("first"));
  REQUIRE(both.commit == std::optional<std::string>("abcdef"));
  REQUIRE(both.normalized_url == "https://github.com/owner/repo");

  RepoReference reversed =
      normalize_repo_url("https://github.com/owner/repo/commit/abc/tree/dev");
  REQUIRE(reversed.commit == std::optional<std::string>("abc"));
  REQUIRE(reversed.branch == std::optional<std::string>("dev"));
}

TEST_CASE("provider is detected from the host", "[repo_url]") {
  REQUIRE(normalize_repo_url("https://gitlab.com/group/project").provider ==
          Provider::GitLab);
  REQUIRE(normalize_repo_url("https://bitbucket.org/team/repo").provider ==
          Provider::Bitbucket);
  RepoReference www = normalize_repo_url("https://WWW.GitHub.com/a/b");
  REQUIRE(www.provider == Provider::GitHub);
  REQUIRE(www.normalized_url == "https://www.github.com/a/b");
}

TEST_CASE("unknown hosts fall back to the primary provider", "[repo_url]") {
  RepoReference ref = normalize_repo_url("https://git.example.com/team/tool");
  REQUIRE(ref.provider == kPrimaryProvider);
  REQUIRE(ref.normalized_url == "https://git.example.com/team/tool");
  REQUIRE(!is_known_provider_url("https://git.example.com/team/tool"));
  REQUIRE(is_known_provider_url("https://gitlab.com/team/tool"));
  REQUIRE(!is_known_provider_url("owner/repo"));
}

TEST_CASE("malformed input is rejected", "[repo_url]") {
  REQUIRE_THROWS_AS(normalize_repo_url("invalid-url"), InvalidFormatError);
  REQUIRE_THROWS_AS(normalize_repo_url(""), InvalidFormatError);
  REQUIRE_THROWS_AS(normalize_repo_url("a/b/c"), InvalidFormatError);
  REQUIRE_THROWS_AS(normalize_repo_url("https://github.com/owner"),
                    MissingOwnerOrRepoError);
  REQUIRE_THROWS_AS(normalize_repo_url("https://github.com/"),
                    MissingOwnerOrRepoError);
  try {
    normalize_repo_url("invalid-url");
    FAIL("expected InvalidFormatError");
  } catch (const ResolveError &e) {
    REQUIRE(e.kind() == ErrorKind::InvalidFormat);
  }
}

TEST_CASE("validate_repo_url accepts urls and shorthand", "[repo_url]") {
  REQUIRE(validate_repo_url("owner/repo"));
  REQUIRE(validate_repo_url("https://github.com/owner/repo"));
  REQUIRE(validate_repo_url("ssh://git@github.com/owner/repo"));
  REQUIRE(!validate_repo_url("owner"));
  REQUIRE(!validate_repo_url("owner/repo/extra"));
  REQUIRE(!validate_repo_url("own er/repo"));
}

TEST_CASE("normalization is idempotent", "[repo_url]") {
  for (const char *input :
       {"owner/repo", "https://github.com/Owner/Repo.git",
        "https://gitlab.com/group/project/tree/dev",
        "https://bitbucket.org/team/repo/commit/deadbeef", "o/r.git.git"}) {
    RepoReference first = normalize_repo_url(input);
    RepoReference second = normalize_repo_url(first.normalized_url);
    REQUIRE(second.normalized_url == first.normalized_url);
    REQUIRE(second.owner == first.owner);
    REQUIRE(second.repo_name == first.repo_name);
    REQUIRE(second.provider == first.provider);
  }
}

TEST_CASE("provider names round trip", "[repo_url]") {
  for (Provider p : {Provider::GitHub, Provider::GitLab, Provider::Bitbucket}) {
    REQUIRE(provider_from_string(provider_name(p)) == p);
  }
  REQUIRE(provider_from_string("GitHub") == Provider::GitHub);
  REQUIRE(!provider_from_string("sourceforge"));
}
