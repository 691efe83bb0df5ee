#include <doctest/doctest.h>

#include "../include/gameplay.hpp"

#include <stdexcept>

TEST_CASE("entity positions derive from the spawn anchors")
{
    const EntityPositions p = derivePositions({1, 2}, {7, 7});

    CHECK(p.pacman == glm::dvec2(7.5, 7.0));
    CHECK(p.ghosts[BLINKY] == glm::dvec2(4.5, 1.0));
    CHECK(p.ghosts[PINKY] == glm::dvec2(4.5, 4.0));
    CHECK(p.ghosts[INKY] == glm::dvec2(2.5, 4.0));
    CHECK(p.ghosts[CLYDE] == glm::dvec2(6.5, 4.0));
}

TEST_CASE("ghost points double per ghost eaten")
{
    CHECK(ghostPoints(0) == 200);
    CHECK(ghostPoints(1) == 400);
    CHECK(ghostPoints(2) == 800);
    CHECK(ghostPoints(3) == 1600);
    CHECK(ghostPoints(7) == 1600);
}

TEST_CASE("fruit by level")
{
    CHECK(fruitForLevel(1).name == "Cherry");
    CHECK(fruitForLevel(1).points == 100);
    CHECK(fruitForLevel(2).points == 300);
    CHECK(fruitForLevel(3).name == "Orange");
    CHECK(fruitForLevel(4).name == "Orange");
    CHECK(fruitForLevel(6).points == 700);
    CHECK(fruitForLevel(8).name == "Melon");
    CHECK(fruitForLevel(9).points == 2000);
    CHECK(fruitForLevel(12).name == "Bell");
    CHECK(fruitForLevel(13).points == 5000);
    CHECK(fruitForLevel(255).name == "Key");
    CHECK_THROWS_AS(fruitForLevel(0), std::invalid_argument);
}

TEST_CASE("ghosts leave the box one dot apart")
{
    CHECK(ghostReleaseDots(BLINKY) == 0);
    CHECK(ghostReleaseDots(PINKY) == 1);
    CHECK(ghostReleaseDots(INKY) == 2);
    CHECK(ghostReleaseDots(CLYDE) == 3);
    CHECK(FRUIT_DOT_THRESHOLDS[0] == 70);
    CHECK(FRUIT_DOT_THRESHOLDS[1] == 170);
}

TEST_CASE("point values and lives")
{
    CHECK(DOT_POINTS == 10);
    CHECK(PELLET_POINTS == 50);
    CHECK(START_LIVES == 3);
    CHECK(MAX_LIVES == START_LIVES);
    CHECK(EXTRA_LIFE_POINTS == 10000);

    // a full arcade board of 240 dots and 4 pellets is worth 2600 points
    CHECK(240 * DOT_POINTS + 4 * PELLET_POINTS == 2600);
    // eating four ghosts on one pellet
    CHECK(ghostPoints(0) + ghostPoints(1) + ghostPoints(2) + ghostPoints(3) == 3000);
}
