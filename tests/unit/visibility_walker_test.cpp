#include <axground/visibility/visibility_walker.h>
#include <axground/core/error.h>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <unordered_map>

using namespace axground;
using namespace axground::ax;
using namespace axground::visibility;

static std::unique_ptr<CanonicalNode> make_node(std::uint32_t id, CanonicalRole role,
                                                geometry::Bounds bounds,
                                                const std::string& name = "") {
    auto node = std::make_unique<CanonicalNode>();
    node->id = id;
    node->role = role;
    node->bounds = bounds;
    node->name = name;
    return node;
}

static std::unique_ptr<CanonicalNode> make_desktop() {
    return make_node(0, CanonicalRole::Desktop, {0, 0, 1920, 1080});
}

static const geometry::ClipRect kScreen = geometry::ClipRect::screen(1920, 1080);

// ---------------------------------------------------------------------------
// 1. Off-screen nodes are pruned
// ---------------------------------------------------------------------------
TEST(VisibilityWalkerTest, ButtonOutsideScreenIsPruned) {
    auto root = make_desktop();
    root->append_child(make_node(1, CanonicalRole::Button, {2000, 0, 10, 10}, "Off"));

    VisibilityWalker walker;
    auto records = walker.walk(*root, kScreen);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].id, 0u);
    EXPECT_EQ(walker.stats().pruned_clipped, 1u);
}

TEST(VisibilityWalkerTest, PartiallyVisibleNodeIsClipped) {
    auto root = make_desktop();
    root->append_child(make_node(1, CanonicalRole::Button, {1900, 1060, 100, 100}, "Edge"));

    VisibilityWalker walker;
    auto records = walker.walk(*root, kScreen);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].visible, (geometry::ClipRect{1900, 1060, 1920, 1080}));
    EXPECT_EQ(records[1].visible_area, 400);
    EXPECT_EQ(records[1].bounds, (geometry::Bounds{1900, 1060, 100, 100}));
}

// ---------------------------------------------------------------------------
// 2. Clip accumulates down the tree
// ---------------------------------------------------------------------------
TEST(VisibilityWalkerTest, ChildIsClippedToParent) {
    auto root = make_desktop();
    auto* panel = root->append_child(make_node(1, CanonicalRole::Panel, {100, 100, 200, 200}));
    panel->append_child(make_node(2, CanonicalRole::Button, {250, 250, 100, 100}, "Half"));

    VisibilityWalker walker;
    auto records = walker.walk(*root, kScreen);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[2].visible, (geometry::ClipRect{250, 250, 300, 300}));
    EXPECT_EQ(records[2].bounds, (geometry::Bounds{250, 250, 100, 100}));
}

TEST(VisibilityWalkerTest, ClippedParentTakesSubtree) {
    auto root = make_desktop();
    auto* panel = root->append_child(make_node(1, CanonicalRole::Panel, {-500, 0, 100, 100}));
    // On screen by itself, but its parent is entirely off screen.
    panel->append_child(make_node(2, CanonicalRole::Button, {10, 10, 50, 50}, "Orphan"));

    VisibilityWalker walker;
    auto records = walker.walk(*root, kScreen);
    EXPECT_EQ(records.size(), 1u);
}

TEST(VisibilityWalkerTest, VisibleRectsShrinkMonotonically) {
    auto root = make_desktop();
    auto* a = root->append_child(make_node(1, CanonicalRole::Panel, {-50, -50, 600, 400}));
    auto* b = a->append_child(make_node(2, CanonicalRole::Panel, {100, 0, 800, 300}));
    b->append_child(make_node(3, CanonicalRole::Button, {500, 250, 200, 200}, "Deep"));
    a->append_child(make_node(4, CanonicalRole::Link, {0, 0, 20, 20}, "Corner"));

    VisibilityWalker walker;
    auto records = walker.walk(*root, kScreen);
    ASSERT_EQ(records.size(), 5u);

    std::unordered_map<std::uint32_t, geometry::ClipRect> visible;
    for (const auto& r : records) {
        visible[r.id] = r.visible;
        EXPECT_GT(r.visible_area, 0);
        EXPECT_TRUE(kScreen.contains(r.visible));
        EXPECT_TRUE(geometry::ClipRect::from_bounds(r.bounds).contains(r.visible));
    }
    EXPECT_TRUE(visible[1].contains(visible[2]));
    EXPECT_TRUE(visible[2].contains(visible[3]));
    EXPECT_TRUE(visible[1].contains(visible[4]));
}

TEST(VisibilityWalkerTest, RecordsAreInPreOrder) {
    auto root = make_desktop();
    auto* a = root->append_child(make_node(1, CanonicalRole::Panel, {0, 0, 500, 500}));
    a->append_child(make_node(2, CanonicalRole::Button, {0, 0, 50, 50}, "A"));
    root->append_child(make_node(3, CanonicalRole::Button, {600, 0, 50, 50}, "B"));

    VisibilityWalker walker;
    auto records = walker.walk(*root, kScreen);
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].id, 0u);
    EXPECT_EQ(records[1].id, 1u);
    EXPECT_EQ(records[2].id, 2u);
    EXPECT_EQ(records[3].id, 3u);
}

// ---------------------------------------------------------------------------
// 3. Zero-size and tiny nodes
// ---------------------------------------------------------------------------
TEST(VisibilityWalkerTest, ZeroSizeNodeIsPrunedWithSubtree) {
    auto root = make_desktop();
    auto* empty = root->append_child(make_node(1, CanonicalRole::Panel, {10, 10, 0, 50}));
    empty->append_child(make_node(2, CanonicalRole::Button, {10, 10, 50, 50}, "Inside"));

    VisibilityWalker walker;
    auto records = walker.walk(*root, kScreen);
    EXPECT_EQ(records.size(), 1u);
    EXPECT_EQ(walker.stats().pruned_zero_size, 1u);
    EXPECT_EQ(walker.stats().visited, 2u);
}

TEST(VisibilityWalkerTest, MissingBoundsMeansNotVisible) {
    auto root = make_desktop();
    root->append_child(make_node(1, CanonicalRole::Button, {}, "NoBounds"));

    VisibilityWalker walker;
    EXPECT_EQ(walker.walk(*root, kScreen).size(), 1u);
}

TEST(VisibilityWalkerTest, SliverBelowMinimumAreaIsPruned) {
    auto root = make_desktop();
    root->append_child(make_node(1, CanonicalRole::Button, {0, 0, 4, 6}, "24px"));
    root->append_child(make_node(2, CanonicalRole::Button, {10, 0, 5, 5}, "25px"));

    VisibilityWalker walker;
    auto records = walker.walk(*root, kScreen);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].id, 2u);
}

TEST(VisibilityWalkerTest, MinimumAreaIsConfigurable) {
    auto root = make_desktop();
    root->append_child(make_node(1, CanonicalRole::Button, {0, 0, 10, 10}, "Small"));

    WalkOptions options;
    options.min_visible_area = 101;
    VisibilityWalker walker(options);
    EXPECT_EQ(walker.walk(*root, kScreen).size(), 1u);
}

// ---------------------------------------------------------------------------
// 4. Subtree policy
// ---------------------------------------------------------------------------
TEST(VisibilityWalkerTest, GeometryFirstKeepsHiddenAndCollapsed) {
    auto root = make_desktop();
    auto* menu = root->append_child(make_node(1, CanonicalRole::Menu, {0, 0, 200, 200}));
    menu->states.insert(CanonicalState::Collapsed);
    menu->append_child(make_node(2, CanonicalRole::MenuItem, {0, 0, 200, 20}, "Open"));
    auto* hidden = root->append_child(make_node(3, CanonicalRole::Button, {300, 0, 50, 50}, "X"));
    hidden->states.insert(CanonicalState::Hidden);

    VisibilityWalker walker;
    auto records = walker.walk(*root, kScreen);
    EXPECT_EQ(records.size(), 4u);
    EXPECT_EQ(walker.stats().pruned_by_state, 0u);
}

TEST(VisibilityWalkerTest, PruneHiddenPolicyDropsStatedSubtrees) {
    auto root = make_desktop();
    auto* menu = root->append_child(make_node(1, CanonicalRole::Menu, {0, 0, 200, 200}));
    menu->states.insert(CanonicalState::Collapsed);
    menu->append_child(make_node(2, CanonicalRole::MenuItem, {0, 0, 200, 20}, "Open"));
    auto* hidden = root->append_child(make_node(3, CanonicalRole::Button, {300, 0, 50, 50}, "X"));
    hidden->states.insert(CanonicalState::Invisible);
    root->append_child(make_node(4, CanonicalRole::Button, {400, 0, 50, 50}, "Y"));

    WalkOptions options;
    options.policy = SubtreePolicy::PruneHiddenOrCollapsed;
    VisibilityWalker walker(options);
    auto records = walker.walk(*root, kScreen);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].id, 4u);
    EXPECT_EQ(walker.stats().pruned_by_state, 2u);
}

TEST(VisibilityWalkerTest, PolicyNames) {
    EXPECT_STREQ(subtree_policy_name(SubtreePolicy::GeometryFirst), "geometry-first");
    EXPECT_STREQ(subtree_policy_name(SubtreePolicy::PruneHiddenOrCollapsed),
                 "prune-hidden-or-collapsed");
}

// ---------------------------------------------------------------------------
// 5. Contract
// ---------------------------------------------------------------------------
TEST(VisibilityWalkerTest, InvertedScreenIsAContractViolation) {
    auto root = make_desktop();
    VisibilityWalker walker;
    EXPECT_THROW(walker.walk(*root, geometry::ClipRect{100, 0, 0, 100}), ContractViolation);
}

TEST(VisibilityWalkerTest, EmptyScreenYieldsNothing) {
    auto root = make_desktop();
    VisibilityWalker walker;
    EXPECT_TRUE(walker.walk(*root, geometry::ClipRect{0, 0, 0, 0}).empty());
}
