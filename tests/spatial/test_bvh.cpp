// crowd_spatial triangle BVH tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <crowd_engine/spatial/bvh.hpp>

#include <vector>

using namespace crowd_spatial;
using Catch::Matchers::WithinAbs;

namespace {

/// n x n quads in the XY plane at height z, spanning [0, n]
TriangleBvh make_grid(int n, float z) {
    std::vector<Vec3> vertices;
    std::vector<TriangleBvh::Triangle> triangles;
    for (int y = 0; y <= n; ++y) {
        for (int x = 0; x <= n; ++x) {
            vertices.emplace_back(static_cast<float>(x), static_cast<float>(y), z);
        }
    }
    const auto stride = static_cast<std::uint32_t>(n + 1);
    for (std::uint32_t y = 0; y < static_cast<std::uint32_t>(n); ++y) {
        for (std::uint32_t x = 0; x < static_cast<std::uint32_t>(n); ++x) {
            const std::uint32_t i = y * stride + x;
            triangles.push_back({i, i + 1, i + stride + 1});
            triangles.push_back({i, i + stride + 1, i + stride});
        }
    }
    return TriangleBvh(std::move(vertices), triangles);
}

} // namespace

TEST_CASE("TriangleBvh construction", "[spatial][bvh]") {
    SECTION("empty") {
        TriangleBvh bvh;
        REQUIRE(bvh.empty());
        REQUIRE_FALSE(bvh.ray_cast(Vec3(0.0f), Vec3(0.0f, 0.0f, -1.0f)).has_value());
        REQUIRE_FALSE(bvh.nearest_point(Vec3(0.0f)).has_value());
    }

    SECTION("grid") {
        const TriangleBvh bvh = make_grid(8, 0.0f);
        REQUIRE(bvh.triangle_count() == 128);
        REQUIRE(bvh.node_count() > 1);
        REQUIRE(bvh.bounds().contains_point(Vec3(4.0f, 4.0f, 0.0f)));
    }

    SECTION("out-of-range triangles are skipped") {
        std::vector<Vec3> vertices = {Vec3(0.0f), Vec3(1.0f, 0.0f, 0.0f), Vec3(0.0f, 1.0f, 0.0f)};
        const TriangleBvh bvh(vertices, {{0, 1, 2}, {0, 1, 9}});
        REQUIRE(bvh.triangle_count() == 1);
    }
}

TEST_CASE("TriangleBvh ray cast", "[spatial][bvh]") {
    const TriangleBvh bvh = make_grid(8, 2.0f);

    SECTION("down onto the grid") {
        auto hit = bvh.ray_cast(Vec3(3.3f, 5.6f, 10.0f), Vec3(0.0f, 0.0f, -1.0f));
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->distance, WithinAbs(8.0f, 1e-4f));
        REQUIRE_THAT(hit->point.z, WithinAbs(2.0f, 1e-4f));
        REQUIRE_THAT(hit->point.x, WithinAbs(3.3f, 1e-4f));
        REQUIRE_THAT(hit->normal.z, WithinAbs(1.0f, 1e-4f));
    }

    SECTION("back faces are hit") {
        auto hit = bvh.ray_cast(Vec3(1.3f, 1.6f, -1.0f), Vec3(0.0f, 0.0f, 1.0f));
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->distance, WithinAbs(3.0f, 1e-4f));
    }

    SECTION("miss outside the grid") {
        REQUIRE_FALSE(bvh.ray_cast(Vec3(20.0f, 1.0f, 10.0f), Vec3(0.0f, 0.0f, -1.0f)).has_value());
    }

    SECTION("max distance") {
        REQUIRE_FALSE(bvh.ray_cast(Vec3(1.3f, 1.6f, 10.0f), Vec3(0.0f, 0.0f, -1.0f), 5.0f).has_value());
    }

    SECTION("closest of two layers") {
        std::vector<Vec3> vertices = {
            Vec3(-1.0f, -1.0f, 0.0f), Vec3(1.0f, -1.0f, 0.0f), Vec3(0.0f, 1.0f, 0.0f),
            Vec3(-1.0f, -1.0f, 5.0f), Vec3(1.0f, -1.0f, 5.0f), Vec3(0.0f, 1.0f, 5.0f),
        };
        const TriangleBvh layers(vertices, {{0, 1, 2}, {3, 4, 5}});
        auto hit = layers.ray_cast(Vec3(0.0f, 0.0f, 10.0f), Vec3(0.0f, 0.0f, -1.0f));
        REQUIRE(hit.has_value());
        REQUIRE(hit->triangle == 1);
        REQUIRE_THAT(hit->distance, WithinAbs(5.0f, 1e-4f));
    }
}

TEST_CASE("TriangleBvh nearest point", "[spatial][bvh]") {
    const TriangleBvh bvh = make_grid(4, 0.0f);

    SECTION("above the surface") {
        auto hit = bvh.nearest_point(Vec3(2.5f, 1.25f, 3.0f));
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->distance, WithinAbs(3.0f, 1e-4f));
        REQUIRE_THAT(hit->point.x, WithinAbs(2.5f, 1e-4f));
        REQUIRE_THAT(hit->point.y, WithinAbs(1.25f, 1e-4f));
    }

    SECTION("beyond the edge") {
        auto hit = bvh.nearest_point(Vec3(-3.0f, 2.0f, 0.0f));
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->point.x, WithinAbs(0.0f, 1e-4f));
        REQUIRE_THAT(hit->distance, WithinAbs(3.0f, 1e-4f));
    }
}
