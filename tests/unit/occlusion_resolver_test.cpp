#include <axground/selection/occlusion_resolver.h>
#include <axground/core/diagnostics.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace axground;
using namespace axground::ax;
using namespace axground::selection;
using axground::visibility::VisibleRecord;

static VisibleRecord make_record(std::uint32_t id, CanonicalRole role, const std::string& name,
                                 geometry::ClipRect visible) {
    VisibleRecord r;
    r.id = id;
    r.role = role;
    r.name = name;
    r.visible = visible;
    r.bounds = {visible.x1, visible.y1, visible.x2 - visible.x1, visible.y2 - visible.y1};
    r.visible_area = visible.area();
    return r;
}

// ---------------------------------------------------------------------------
// 1. Partial overlap below the coverage ratio
// ---------------------------------------------------------------------------
TEST(OcclusionResolverTest, QuarterOverlapKeepsBoth) {
    std::vector<VisibleRecord> records = {
        make_record(1, CanonicalRole::Button, "B1", {0, 0, 100, 100}),
        make_record(2, CanonicalRole::Button, "B2", {50, 50, 150, 150}),
    };
    OcclusionResolver resolver;
    auto samples = resolver.resolve(records, records);
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[0].id, 1u);
    EXPECT_EQ(samples[1].id, 2u);
}

// ---------------------------------------------------------------------------
// 2. Near-full overlap covering the center
// ---------------------------------------------------------------------------
TEST(OcclusionResolverTest, MostlyCoveredButtonIsOccluded) {
    std::vector<VisibleRecord> records = {
        make_record(1, CanonicalRole::Button, "B1", {0, 0, 100, 100}),
        make_record(2, CanonicalRole::Button, "B2", {10, 10, 110, 110}),
    };
    OcclusionResolver resolver;
    auto samples = resolver.resolve(records, records);
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].id, 2u);
    EXPECT_EQ(samples[0].bbox, (geometry::ClipRect{10, 10, 110, 110}));
    EXPECT_EQ(samples[0].point, (geometry::Point{60, 60}));
}

TEST(OcclusionResolverTest, ReversingOrderFlipsWhichButtonIsDropped) {
    // 90x90 of 100x100 overlap (81%), each center inside the other.
    auto a = make_record(1, CanonicalRole::Button, "A", {0, 0, 100, 100});
    auto b = make_record(2, CanonicalRole::Button, "B", {10, 10, 110, 110});
    OcclusionResolver resolver;

    std::vector<VisibleRecord> a_first = {a, b};
    auto samples = resolver.resolve(a_first, a_first);
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].name, "B");

    std::vector<VisibleRecord> b_first = {b, a};
    samples = resolver.resolve(b_first, b_first);
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].name, "A");
}

TEST(OcclusionResolverTest, CoverageMustExceedRatio) {
    auto below = make_record(1, CanonicalRole::Button, "Below", {0, 0, 100, 100});
    auto above = make_record(2, CanonicalRole::Image, "Above", {0, 0, 100, 60});
    OcclusionResolver resolver;
    EXPECT_TRUE(resolver.occludes(above, below));

    auto narrow = make_record(3, CanonicalRole::Image, "Narrow", {0, 0, 49, 100});
    EXPECT_FALSE(resolver.occludes(narrow, below));

    auto strip = make_record(4, CanonicalRole::Image, "Strip", {0, 0, 100, 50});
    // Exactly half is not more than half.
    EXPECT_FALSE(resolver.occludes(strip, below));
}

// ---------------------------------------------------------------------------
// 3. Non-occluding roles
// ---------------------------------------------------------------------------
TEST(OcclusionResolverTest, LabelOnTopNeverOccludes) {
    std::vector<VisibleRecord> records = {
        make_record(1, CanonicalRole::Button, "Submit", {0, 0, 200, 50}),
        make_record(2, CanonicalRole::Label, "Submit", {0, 0, 200, 50}),
    };
    OcclusionResolver resolver;
    auto samples = resolver.resolve({records[0]}, records);
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].id, 1u);
}

TEST(OcclusionResolverTest, LayoutRolesNeverOcclude) {
    auto below = make_record(1, CanonicalRole::Button, "B", {0, 0, 100, 100});
    OcclusionResolver resolver;
    for (auto role : {CanonicalRole::Panel, CanonicalRole::ListBox, CanonicalRole::ListItem,
                      CanonicalRole::Window, CanonicalRole::Desktop}) {
        EXPECT_FALSE(resolver.occludes(make_record(2, role, "", {0, 0, 100, 100}), below))
            << role_name(role);
    }
    EXPECT_TRUE(resolver.occludes(make_record(2, CanonicalRole::Dialog, "", {0, 0, 100, 100}),
                                  below));
}

// ---------------------------------------------------------------------------
// 4. Paint order
// ---------------------------------------------------------------------------
TEST(OcclusionResolverTest, EarlierRecordsNeverOcclude) {
    std::vector<VisibleRecord> records = {
        make_record(1, CanonicalRole::Image, "Backdrop", {0, 0, 100, 100}),
        make_record(2, CanonicalRole::Button, "Front", {0, 0, 100, 100}),
    };
    OcclusionResolver resolver;
    auto samples = resolver.resolve({records[1]}, records);
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].id, 2u);
}

TEST(OcclusionResolverTest, LaterDescendantImageOccludesContainer) {
    // A button whose own icon fills it is dropped.
    std::vector<VisibleRecord> records = {
        make_record(1, CanonicalRole::Button, "Play", {0, 0, 40, 40}),
        make_record(2, CanonicalRole::Image, "", {0, 0, 40, 40}),
    };
    OcclusionResolver resolver;
    EXPECT_TRUE(resolver.resolve({records[0]}, records).empty());
}

TEST(OcclusionResolverTest, CandidateMissingFromRecordsIsKept) {
    std::vector<VisibleRecord> records = {
        make_record(2, CanonicalRole::Image, "", {0, 0, 100, 100}),
    };
    auto stray = make_record(1, CanonicalRole::Button, "Stray", {0, 0, 100, 100});
    OcclusionResolver resolver;
    EXPECT_EQ(resolver.resolve({stray}, records).size(), 1u);
}

// ---------------------------------------------------------------------------
// 5. Degenerate geometry and configuration
// ---------------------------------------------------------------------------
TEST(OcclusionResolverTest, ZeroAreaCandidateIsNotOccluded) {
    auto below = make_record(1, CanonicalRole::Button, "Flat", {10, 10, 10, 10});
    auto above = make_record(2, CanonicalRole::Image, "", {0, 0, 100, 100});
    OcclusionResolver resolver;
    EXPECT_FALSE(resolver.occludes(above, below));
}

TEST(OcclusionResolverTest, CoverageRatioIsConfigurable) {
    auto below = make_record(1, CanonicalRole::Button, "B1", {0, 0, 100, 100});
    auto above = make_record(2, CanonicalRole::Button, "B2", {0, 0, 60, 100});
    OcclusionRules rules;
    rules.coverage_ratio = 0.9;
    OcclusionResolver strict(rules);
    EXPECT_FALSE(strict.occludes(above, below));
    EXPECT_TRUE(OcclusionResolver().occludes(above, below));
}

TEST(OcclusionResolverTest, ReportsOccludedCount) {
    std::vector<VisibleRecord> records = {
        make_record(1, CanonicalRole::Button, "B1", {0, 0, 100, 100}),
        make_record(2, CanonicalRole::Button, "B2", {10, 10, 110, 110}),
    };
    core::DiagnosticEmitter diagnostics;
    OcclusionResolver resolver;
    resolver.set_diagnostics(&diagnostics);
    resolver.resolve(records, records);
    const auto& events = diagnostics.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].module, "selection");
    EXPECT_EQ(events[0].message, "1 samples, 1 occluded");
}

// ---------------------------------------------------------------------------
// 6. Sample construction
// ---------------------------------------------------------------------------
TEST(MakeSampleTest, UsesVisibleRectAndTrimmedName) {
    auto record = make_record(7, CanonicalRole::Link, "  Docs \n", {10, 20, 31, 41});
    record.bounds = {0, 0, 500, 500};
    Sample sample = make_sample(record);
    EXPECT_EQ(sample.id, 7u);
    EXPECT_EQ(sample.category, CanonicalRole::Link);
    EXPECT_EQ(sample.name, "Docs");
    EXPECT_EQ(sample.bbox, (geometry::ClipRect{10, 20, 31, 41}));
    EXPECT_EQ(sample.point, (geometry::Point{20, 30}));
}
