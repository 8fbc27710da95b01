// crowd_spatial volume octree tests

#include <catch2/catch_test_macros.hpp>
#include <crowd_engine/spatial/octree.hpp>

#include <vector>

using namespace crowd_spatial;

TEST_CASE("BoundingVolume containment", "[spatial][octree]") {
    const auto box = BoundingVolume::make_box(Vec3(0.0f), Vec3(1.0f, 2.0f, 0.5f));
    REQUIRE(box.contains(Vec3(1.0f, 2.0f, 0.5f)));
    REQUIRE_FALSE(box.contains(Vec3(0.0f, 0.0f, 0.6f)));

    const auto sphere = BoundingVolume::make_sphere(Vec3(5.0f, 0.0f, 0.0f), 1.0f);
    REQUIRE(sphere.contains(Vec3(6.0f, 0.0f, 0.0f)));
    REQUIRE_FALSE(sphere.contains(Vec3(5.8f, 0.8f, 0.0f)));
    REQUIRE(sphere.bounds().contains_point(Vec3(5.8f, 0.8f, 0.0f)));
}

TEST_CASE("VolumeOctree empty", "[spatial][octree]") {
    VolumeOctree tree;
    REQUIRE(tree.size() == 0);
    REQUIRE(tree.containing(Vec3(0.0f)).empty());
    REQUIRE_FALSE(tree.any_contains(Vec3(0.0f)));
}

TEST_CASE("VolumeOctree queries", "[spatial][octree]") {
    std::vector<BoundingVolume> volumes;
    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 10; ++x) {
            volumes.push_back(BoundingVolume::make_box(
                Vec3(static_cast<float>(x) * 10.0f, static_cast<float>(y) * 10.0f, 0.0f), Vec3(1.0f)));
        }
    }
    // One large sphere overlapping the first box
    volumes.push_back(BoundingVolume::make_sphere(Vec3(0.0f), 3.0f));

    const VolumeOctree tree(volumes, VolumeOctree::Config{4, 6});
    REQUIRE(tree.size() == 101);
    REQUIRE(tree.node_count() > 1);

    SECTION("inside one box") {
        const auto found = tree.containing(Vec3(30.5f, 70.5f, 0.0f));
        REQUIRE(found.size() == 1);
        REQUIRE(found[0] == 73);
        REQUIRE(tree.any_contains(Vec3(30.5f, 70.5f, 0.0f)));
    }

    SECTION("between boxes") {
        REQUIRE(tree.containing(Vec3(35.0f, 35.0f, 0.0f)).empty());
        REQUIRE_FALSE(tree.any_contains(Vec3(35.0f, 35.0f, 0.0f)));
    }

    SECTION("overlapping volumes sorted") {
        const auto found = tree.containing(Vec3(0.5f, 0.5f, 0.0f));
        REQUIRE(found == std::vector<std::size_t>{0, 100});
    }

    SECTION("sphere only") {
        const auto found = tree.containing(Vec3(2.5f, 0.0f, 0.0f));
        REQUIRE(found == std::vector<std::size_t>{100});
    }

    SECTION("matches brute force") {
        for (float x = -5.0f; x < 95.0f; x += 3.7f) {
            const Vec3 p(x, x * 0.9f, 0.25f);
            std::vector<std::size_t> expected;
            for (std::size_t i = 0; i < volumes.size(); ++i) {
                if (volumes[i].contains(p)) {
                    expected.push_back(i);
                }
            }
            REQUIRE(tree.containing(p) == expected);
        }
    }
}
