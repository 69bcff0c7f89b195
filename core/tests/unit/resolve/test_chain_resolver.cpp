// tests/unit/resolve/test_chain_resolver.cpp - Version lookup over chains
//

#include <gtest/gtest.h>

#include <string>

#include "lineage/basic/diagnostic.hpp"
#include "lineage/registry/type_registry.hpp"
#include "lineage/resolve/chain_resolver.hpp"

using namespace lineage;

namespace
{

// firmware: 1.0 -> 1.1 -> 2.0
class ChainResolverTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    v10 = registry.register_root("firmware", Topology::Chain, "1.0", "Ver1").node;
    v11 = registry.register_node(v10, "1.1", "Ver2").node;
    v20 = registry.register_node(v11, "2.0", "Ver3").node;
    registry.freeze();
  }

  std::string tag_of(NodeRef ref) const { return registry.get_node(ref)->tag; }

  TypeRegistry registry;
  NodeRef v10;
  NodeRef v11;
  NodeRef v20;
};

}  // namespace

// ============================================================================
// find_version
// ============================================================================

TEST_F(ChainResolverTest, ReturnsNewestVersionNotNewerThanQuery)
{
  const NodeResult r = find_version(registry, v10, "1.5");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.node, v11);
  EXPECT_EQ(tag_of(r.node), "1.1");
}

TEST_F(ChainResolverTest, ExactMatchBoundaries)
{
  EXPECT_EQ(find_version(registry, v10, "1.0").node, v10);
  EXPECT_EQ(find_version(registry, v10, "1.1").node, v11);
  EXPECT_EQ(find_version(registry, v10, "2.0").node, v20);
  EXPECT_EQ(find_version(registry, v10, "1.1.0").node, v11);
}

TEST_F(ChainResolverTest, QueryOlderThanRootFails)
{
  const NodeResult r = find_version(registry, v10, "0.5");
  ASSERT_TRUE(r.has_error());
  EXPECT_EQ(r.error_kind(), ErrorKind::VersionNotFound);
  EXPECT_NE(r.error->message.find("0.5"), std::string::npos);
}

TEST_F(ChainResolverTest, QueryNewerThanEverythingReturnsNewest)
{
  const NodeResult r = find_version(registry, v10, "9.0");
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.node, v20);
}

TEST_F(ChainResolverTest, LookupMayStartMidChain)
{
  EXPECT_EQ(find_version(registry, v11, "1.9").node, v11);
  EXPECT_EQ(find_version(registry, v11, "3.0").node, v20);
  EXPECT_EQ(find_version(registry, v11, "1.0").error_kind(), ErrorKind::VersionNotFound);
}

TEST_F(ChainResolverTest, MalformedQueryIsInvalidVersion)
{
  const NodeResult r = find_version(registry, v10, "1..5");
  ASSERT_TRUE(r.has_error());
  EXPECT_EQ(r.error_kind(), ErrorKind::InvalidVersion);
}

TEST_F(ChainResolverTest, RepeatedQueriesAreIdentical)
{
  const NodeRef first = find_version(registry, v10, "1.7").node;
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(find_version(registry, v10, "1.7").node, first);
  }
}

TEST_F(ChainResolverTest, ForeignStartIsInvalidNode)
{
  EXPECT_EQ(find_version(registry, NodeRef(99), "1.0").error_kind(), ErrorKind::InvalidNode);
  EXPECT_EQ(find_version(registry, NodeRef{}, "1.0").error_kind(), ErrorKind::InvalidNode);
}

// ============================================================================
// Fallbacks
// ============================================================================

TEST_F(ChainResolverTest, BaseFallbackReturnsStartAndWarns)
{
  DiagnosticBag diags;
  ResolveOptions options;
  options.fallback = Fallback::Base;
  options.diagnostics = &diags;

  const NodeResult r = find_version(registry, v10, "0.5", options);
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.node, v10);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].severity, Severity::Warning);
  EXPECT_EQ(diags.all()[0].code, "W201");
}

TEST_F(ChainResolverTest, LatestFallbackReturnsNewestAndWarns)
{
  DiagnosticBag diags;
  ResolveOptions options;
  options.fallback = Fallback::Latest;
  options.diagnostics = &diags;

  const NodeResult r = find_version(registry, v10, "0.5", options);
  ASSERT_TRUE(r.success());
  EXPECT_EQ(r.node, v20);
  ASSERT_TRUE(diags.has_warnings());
  EXPECT_EQ(diags.all()[0].code, "W202");
}

TEST_F(ChainResolverTest, FallbackIsUnusedWhenVersionResolves)
{
  DiagnosticBag diags;
  ResolveOptions options;
  options.fallback = Fallback::Base;
  options.diagnostics = &diags;

  EXPECT_EQ(find_version(registry, v10, "1.5", options).node, v11);
  EXPECT_TRUE(diags.empty());
}

TEST_F(ChainResolverTest, FallbackWithoutDiagnosticBag)
{
  ResolveOptions options;
  options.fallback = Fallback::Base;
  EXPECT_EQ(find_version(registry, v10, "0.1", options).node, v10);
}

// ============================================================================
// find_previous_version
// ============================================================================

TEST_F(ChainResolverTest, PreviousVersionIsParent)
{
  EXPECT_EQ(find_previous_version(registry, v20).node, v11);
  EXPECT_EQ(find_previous_version(registry, v11).node, v10);
}

TEST_F(ChainResolverTest, RootHasNoPreviousVersion)
{
  const NodeResult r = find_previous_version(registry, v10);
  ASSERT_TRUE(r.has_error());
  EXPECT_EQ(r.error_kind(), ErrorKind::NoPreviousVersion);
}

TEST_F(ChainResolverTest, PreviousVersionByTagClimbsAncestors)
{
  EXPECT_EQ(find_previous_version(registry, v20, "1.0").node, v10);
  EXPECT_EQ(find_previous_version(registry, v20, "1.1").node, v11);
  EXPECT_EQ(find_previous_version(registry, v20, "1.1.0").node, v11);
}

TEST_F(ChainResolverTest, PreviousVersionByTagExcludesSelfAndGaps)
{
  EXPECT_EQ(
    find_previous_version(registry, v20, "2.0").error_kind(), ErrorKind::NoPreviousVersion);
  EXPECT_EQ(
    find_previous_version(registry, v20, "1.5").error_kind(), ErrorKind::NoPreviousVersion);
  EXPECT_EQ(
    find_previous_version(registry, v10, "1.0").error_kind(), ErrorKind::NoPreviousVersion);
  EXPECT_EQ(find_previous_version(registry, v20, "x..y").error_kind(), ErrorKind::InvalidVersion);
}

TEST_F(ChainResolverTest, LatestVersionIsDeepestNode)
{
  EXPECT_EQ(find_latest_version(registry, v10).node, v20);
  EXPECT_EQ(find_latest_version(registry, v20).node, v20);
}

// ============================================================================
// Chain resolver over tree hierarchies
// ============================================================================

TEST(ChainResolverOnTree, BranchingNodeIsAmbiguous)
{
  TypeRegistry registry;
  const NodeRef root = registry.register_root("api", Topology::Tree, "1.0").node;
  ASSERT_TRUE(registry.register_node(root, "1.1").success());
  ASSERT_TRUE(registry.register_node(root, "1.2").success());

  const NodeResult r = find_version(registry, root, "1.5");
  ASSERT_TRUE(r.has_error());
  EXPECT_EQ(r.error_kind(), ErrorKind::AmbiguousChain);

  EXPECT_EQ(find_latest_version(registry, root).error_kind(), ErrorKind::AmbiguousChain);

  // The root check happens before the walk reaches the branch
  EXPECT_EQ(find_version(registry, root, "0.1").error_kind(), ErrorKind::VersionNotFound);
}

TEST(ChainResolverOnTree, LinearTreeResolvesLikeAChain)
{
  TypeRegistry registry;
  const NodeRef root = registry.register_root("api", Topology::Tree, "1.0").node;
  const NodeRef v2 = registry.register_node(root, "2.0").node;

  EXPECT_EQ(find_version(registry, root, "2.5").node, v2);
  EXPECT_EQ(find_version(registry, root, "1.5").node, root);
}

TEST(ChainResolverOnTree, NonVersionTagIsInvalidVersion)
{
  TypeRegistry registry;
  const NodeRef root = registry.register_root("phone", Topology::Tree, "Phone X").node;

  EXPECT_EQ(find_version(registry, root, "1.0").error_kind(), ErrorKind::InvalidVersion);
}
