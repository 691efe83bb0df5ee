#include <doctest/doctest.h>

#include "viewmodel/level_catalog.hpp"
#include "fixtures.hpp"

#include <filesystem>
#include <stdexcept>

namespace {

std::filesystem::path manifestPath()
{
    return std::filesystem::path(PAKU_LEVEL_DIR) / "levels.json";
}

}

TEST_CASE("catalog lists the bundled levels")
{
    const LevelCatalog catalog = LevelCatalog::load(manifestPath());

    CHECK(catalog.name() == "arcade");
    REQUIRE(catalog.size() == 2);
    CHECK(std::filesystem::path(catalog.levelPath(0)).filename() == "0.lvl");
    CHECK(std::filesystem::path(catalog.levelPath(1)).filename() == "1.lvl");
    CHECK(catalog.loadLevel(1).warps.size() == 2);
    CHECK_THROWS_AS(catalog.levelPath(2), std::out_of_range);
}

TEST_CASE("catalog name defaults to the manifest stem")
{
    const auto path = writeTempFile("unnamed.json", "{\"levels\": [\"a.lvl\"]}");
    const LevelCatalog catalog = LevelCatalog::load(path);
    CHECK(catalog.name() == "paku_test_unnamed");
    CHECK(std::filesystem::path(catalog.levelPath(0)).parent_path() == path.parent_path());
    std::filesystem::remove(path);
}

TEST_CASE("catalog rejects bad manifests")
{
    CHECK_THROWS_AS(LevelCatalog::load(std::filesystem::path(PAKU_LEVEL_DIR) / "missing.json"), std::runtime_error);

    const auto malformed = writeTempFile("malformed.json", "{ not json");
    CHECK_THROWS_AS(LevelCatalog::load(malformed), std::runtime_error);
    std::filesystem::remove(malformed);

    const auto empty = writeTempFile("empty.json", "{\"levels\": []}");
    CHECK_THROWS_AS(LevelCatalog::load(empty), std::runtime_error);
    std::filesystem::remove(empty);

    const auto numbers = writeTempFile("numbers.json", "{\"levels\": [1, 2]}");
    CHECK_THROWS_AS(LevelCatalog::load(numbers), std::runtime_error);
    std::filesystem::remove(numbers);
}

TEST_CASE("catalog level errors reach the caller")
{
    const auto broken = writeTempFile("broken.lvl", "####\n###\n");
    const auto manifest = writeTempFile("broken.json", "{\"levels\": [\"paku_test_broken.lvl\"]}");
    const LevelCatalog catalog = LevelCatalog::load(manifest);
    try {
        catalog.loadLevel(0);
        FAIL("expected LevelNotRectangular");
    } catch (const LevelError& ex) {
        CHECK(ex.kind() == ErrorKind::LevelNotRectangular);
    }
    std::filesystem::remove(broken);
    std::filesystem::remove(manifest);
}

TEST_CASE("default level is found from the source tree")
{
    REQUIRE(LevelCatalog::findManifest().has_value());

    const auto level = LevelCatalog::loadDefault();
    REQUIRE(level.has_value());
    CHECK(level->board.width() == 28);
    CHECK(level->board.height() == 31);
}

TEST_CASE("manifest search starts at the nearest directory")
{
    const auto root = std::filesystem::temp_directory_path() / "paku_test_search";
    const auto nested = root / "a" / "b";
    std::filesystem::create_directories(nested);
    std::filesystem::create_directories(root / "levels");
    std::ofstream(root / "levels" / "levels.json") << "{\"levels\": [\"0.lvl\"]}";

    const auto found = LevelCatalog::findManifest(nested);
    REQUIRE(found.has_value());
    CHECK(*found == root / "levels" / "levels.json");

    const auto roots = LevelCatalog::searchRoots(nested);
    REQUIRE(roots.size() >= 4);
    CHECK(roots[0] == nested);
    CHECK(roots[1] == root / "a");
    CHECK(roots[2] == root);

    std::filesystem::remove_all(root);
}

TEST_CASE("manifest search falls back to the source tree")
{
    const auto found = LevelCatalog::findManifest(std::filesystem::temp_directory_path());
    REQUIRE(found.has_value());
    CHECK(found->filename() == "levels.json");
    CHECK(found->parent_path().filename() == "levels");
}
