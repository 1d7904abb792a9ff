#include <gtest/gtest.h>
#include "reference_backend.hpp"

class ReferenceBackendTest : public ::testing::Test {
protected:
    ReferenceBackend backend;
};

TEST_F(ReferenceBackendTest, TranslationMatrixIsExact) {
    Transform t;
    t.position = {1.0f, 2.0f, 3.0f};

    auto m = backend.batch_compose_transforms({t});
    const std::vector<float> expected{
        1, 0, 0, 0,
        0, 1, 0, 0,
        0, 0, 1, 0,
        1, 2, 3, 1,
    };
    EXPECT_EQ(m, expected);
}

TEST_F(ReferenceBackendTest, BatchKeepsInputOrder) {
    std::vector<Transform> ts(3);
    for (int i = 0; i < 3; ++i) ts[i].position.x = static_cast<float>(i + 10);

    auto m = backend.batch_compose_transforms(ts);
    ASSERT_EQ(m.size(), 48);
    EXPECT_EQ(m[12], 10.0f);
    EXPECT_EQ(m[16 + 12], 11.0f);
    EXPECT_EQ(m[32 + 12], 12.0f);
}

TEST_F(ReferenceBackendTest, EmptyInputsGiveEmptyResults) {
    EXPECT_TRUE(backend.batch_compose_transforms({}).empty());
    EXPECT_TRUE(backend.interpolate_paths({}).empty());
    EXPECT_TRUE(backend.pack_memory_layout({}).empty());
}

TEST_F(ReferenceBackendTest, LayoutIsRunningSumInInputOrder) {
    auto slots = backend.pack_memory_layout({{"a", 16, 8, 0}, {"b", 4, 4, 9}, {"c", 32, 16, 1}});
    ASSERT_EQ(slots.size(), 3);
    EXPECT_EQ(slots[0].offset, 0);
    EXPECT_EQ(slots[1].offset, 16);
    EXPECT_EQ(slots[2].offset, 20);
    EXPECT_EQ(slots[0].address, 0x1000);
    EXPECT_EQ(slots[2].address, 0x1000 + 20);
    EXPECT_EQ(slots[2].id, "c");
}

TEST_F(ReferenceBackendTest, GeometryPassesThroughUnchanged) {
    GeometryBuffers g;
    g.positions = {0, 0, 0, 1, 0, 0, 0, 1, 0, 1, 0, 0};
    g.indices = {0, 1, 2, 0, 1, 3};

    GeometryBuffers out = backend.optimize_geometry(g);
    EXPECT_EQ(out.positions, g.positions);
    EXPECT_EQ(out.indices, g.indices);
}

TEST_F(ReferenceBackendTest, GeometryValidationFailureThrows) {
    GeometryBuffers g;
    g.positions = {0, 0, 0, 1};
    EXPECT_THROW(backend.optimize_geometry(g), std::invalid_argument);
}

TEST_F(ReferenceBackendTest, PathsHaveRaisedMidpoint) {
    PathSegment s;
    s.start = {0.0f, 0.0f, 0.0f};
    s.end = {4.0f, 0.0f, 0.0f};
    s.weight = 0.5f;

    auto paths = backend.interpolate_paths({s, s});
    ASSERT_EQ(paths.size(), 2);
    ASSERT_EQ(paths[0].size(), 3);
    EXPECT_EQ(paths[0][0].x, 0.0f);
    EXPECT_EQ(paths[0][1].x, 2.0f);
    EXPECT_EQ(paths[0][1].y, 0.5f);
    EXPECT_EQ(paths[0][2].x, 4.0f);
}

TEST_F(ReferenceBackendTest, Name) {
    EXPECT_EQ(backend.name(), "reference");
}
