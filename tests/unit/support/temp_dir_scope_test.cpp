#include <catch2/catch_test_macros.hpp>

#include "support/temp_dir_scope.hpp"

#include <cstdlib>
#include <fstream>

namespace ts = chatmedia::test_support;
namespace fs = std::filesystem;

TEST_CASE("TempDirScope creates distinct directories and removes them", "[support]") {
    fs::path first;
    {
        auto a = ts::TempDirScope::unique_under("chatmedia_scope");
        auto b = ts::TempDirScope::unique_under("chatmedia_scope");
        first = a.path();
        CHECK(fs::is_directory(a.path()));
        CHECK(a.path() != b.path());
        std::ofstream(a / "file.bin") << "x";
        CHECK(fs::exists(a / "file.bin"));
    }
    CHECK_FALSE(fs::exists(first));
}

TEST_CASE("TempDirScope honours the scratch root override", "[support]") {
    auto outer = ts::TempDirScope::unique_under("chatmedia_scope_root");
    ::setenv("CHATMEDIA_TEST_TMPDIR", outer.path().c_str(), 1);
    fs::path inner;
    {
        auto scope = ts::TempDirScope::unique_under("nested");
        inner = scope.path();
        CHECK(inner.parent_path() == outer.path());
    }
    ::unsetenv("CHATMEDIA_TEST_TMPDIR");
    CHECK_FALSE(fs::exists(inner));
}

TEST_CASE("TempDirScope moves ownership", "[support]") {
    auto source = ts::TempDirScope::unique_under("chatmedia_scope_move");
    const auto path = source.path();
    {
        ts::TempDirScope moved(std::move(source));
        CHECK(moved.path() == path);
        CHECK(source.path().empty());
    }
    CHECK_FALSE(fs::exists(path));
}
