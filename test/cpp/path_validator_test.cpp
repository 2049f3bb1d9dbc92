#include <catch2/catch_test_macros.hpp>
#include <filesystem>

#include "path_validator.hpp"
#include "test_utils.hpp"

using namespace toolhost;
using namespace toolhost::test;

namespace {

std::string canonical(const std::filesystem::path& path) {
    return std::filesystem::weakly_canonical(path).string();
}

} // namespace

TEST_CASE("PathValidator: traversal detection", "[path]") {
    REQUIRE(PathValidator::ContainsTraversal("../etc/passwd"));
    REQUIRE(PathValidator::ContainsTraversal("logs/../../etc"));
    REQUIRE(PathValidator::ContainsTraversal("%2e%2e/secret"));
    REQUIRE(PathValidator::ContainsTraversal("..\\windows"));
    REQUIRE_FALSE(PathValidator::ContainsTraversal("logs/app..log"));
    REQUIRE_FALSE(PathValidator::ContainsTraversal("/var/log/syslog"));
}

TEST_CASE("PathValidator: URL decoding", "[path]") {
    REQUIRE(PathValidator::UrlDecode("a%20b") == "a b");
    REQUIRE(PathValidator::UrlDecode("%2F") == "/");
    REQUIRE(PathValidator::UrlDecode("100%") == "100%");
    REQUIRE(PathValidator::UrlDecode("%zz") == "%zz");
}

TEST_CASE("PathValidator: rejected input", "[path]") {
    PathValidator validator;

    auto empty = validator.ValidatePath("");
    REQUIRE_FALSE(empty);
    REQUIRE(empty.error().message == "Path cannot be empty");
    REQUIRE(empty.error().category == ErrorCategory::Validation);

    auto nul = validator.ValidatePath(std::string("file\0name", 9));
    REQUIRE_FALSE(nul);
    REQUIRE(nul.error().message == "Path contains null bytes");

    auto traversal = validator.ValidatePath("/tmp/../etc/passwd");
    REQUIRE_FALSE(traversal);
    REQUIRE(traversal.error().message == "Path traversal not allowed");

    PathValidator absolute_only(PathValidator::Config{{}, false});
    auto relative = absolute_only.ValidatePath("notes.txt");
    REQUIRE_FALSE(relative);
    REQUIRE(relative.error().message == "Relative paths not allowed");
}

TEST_CASE("PathValidator: allowed prefixes", "[path]") {
    TempDirectory root("path_root");
    auto file = root.writeFile("app.log", "line\n");
    PathValidator validator(PathValidator::Config{{root.path()}, true});

    SECTION("Absolute paths inside the root") {
        auto result = validator.ValidatePath(file.string());
        REQUIRE(result);
        REQUIRE(result.value() == canonical(file));
    }

    SECTION("Relative paths resolve against the root") {
        auto result = validator.ValidatePath("app.log");
        REQUIRE(result);
        REQUIRE(result.value() == canonical(file));
    }

    SECTION("Outside the root") {
        auto result = validator.ValidatePath("/etc/hostname");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().message == "Path not within allowed directory");
    }

    SECTION("A sibling sharing the prefix string is outside") {
        REQUIRE_FALSE(validator.IsPathAllowed(canonical(root.fsPath()) + "-other/file"));
        REQUIRE(validator.IsPathAllowed(canonical(root.fsPath())));
    }

    SECTION("A symlink cannot escape the root") {
        TempDirectory outside("path_outside");
        auto secret = outside.writeFile("secret.txt", "x");
        std::error_code ec;
        std::filesystem::create_symlink(secret, root.fsPath() / "link.txt", ec);
        if (!ec) {
            auto result = validator.ValidatePath((root.fsPath() / "link.txt").string());
            REQUIRE_FALSE(result);
            REQUIRE(result.error().message == "Path not within allowed directory");
        }
    }
}

TEST_CASE("PathValidator: no prefixes allows everything", "[path]") {
    PathValidator validator;
    REQUIRE(validator.IsPathAllowed("/anywhere"));
    REQUIRE(validator.ValidatePath("/var/log/missing.log"));
}
