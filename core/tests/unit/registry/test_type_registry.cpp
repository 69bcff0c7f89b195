// tests/unit/registry/test_type_registry.cpp - Node registration rules
//

#include <gtest/gtest.h>

#include "lineage/registry/error.hpp"
#include "lineage/registry/type_registry.hpp"

using namespace lineage;

// ============================================================================
// Roots
// ============================================================================

TEST(TypeRegistry, RegisterRootCreatesHierarchy)
{
  TypeRegistry registry;
  const NodeResult root = registry.register_root("firmware", Topology::Chain, "1.0", "Ver1");
  ASSERT_TRUE(root.success());

  const TypeNode * node = registry.get_node(root.node);
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(node->tag, "1.0");
  EXPECT_EQ(node->name, "Ver1");
  EXPECT_TRUE(node->is_root());
  EXPECT_EQ(node->root, root.node);
  EXPECT_EQ(node->depth, 0U);
  EXPECT_EQ(node->topology, Topology::Chain);
  ASSERT_TRUE(node->version.has_value());

  ASSERT_TRUE(registry.find_root("firmware").has_value());
  EXPECT_EQ(*registry.find_root("firmware"), root.node);
  EXPECT_FALSE(registry.find_root("phone").has_value());
}

TEST(TypeRegistry, DuplicateRootIsRejected)
{
  TypeRegistry registry;
  ASSERT_TRUE(registry.register_root("firmware", Topology::Chain, "1.0").success());

  const NodeResult second = registry.register_root("firmware", Topology::Chain, "0.9");
  ASSERT_TRUE(second.has_error());
  EXPECT_EQ(second.error_kind(), ErrorKind::DuplicateRoot);
  EXPECT_EQ(registry.size(), 1U);
}

TEST(TypeRegistry, SeparateHierarchiesMayShareTags)
{
  TypeRegistry registry;
  EXPECT_TRUE(registry.register_root("firmware", Topology::Chain, "1.0").success());
  EXPECT_TRUE(registry.register_root("bootloader", Topology::Chain, "1.0").success());

  ASSERT_EQ(registry.hierarchies().size(), 2U);
  EXPECT_EQ(registry.hierarchies()[0].name, "firmware");
  EXPECT_EQ(registry.hierarchies()[1].name, "bootloader");
}

TEST(TypeRegistry, ChainRootMustBeAVersion)
{
  TypeRegistry registry;
  const NodeResult r = registry.register_root("firmware", Topology::Chain, "1..0");
  ASSERT_TRUE(r.has_error());
  EXPECT_EQ(r.error_kind(), ErrorKind::InvalidVersion);
  EXPECT_TRUE(registry.hierarchies().empty());
}

// ============================================================================
// Chain Children
// ============================================================================

TEST(TypeRegistry, ChainChildrenAreLinked)
{
  TypeRegistry registry;
  const NodeRef v10 = registry.register_root("firmware", Topology::Chain, "1.0").node;
  const NodeResult v11 = registry.register_node(v10, "1.1", "Ver2");
  ASSERT_TRUE(v11.success());

  const TypeNode * parent = registry.get_node(v10);
  ASSERT_EQ(parent->children.size(), 1U);
  EXPECT_EQ(parent->children[0], v11.node);

  const TypeNode * child = registry.get_node(v11.node);
  EXPECT_EQ(child->parent, v10);
  EXPECT_EQ(child->root, v10);
  EXPECT_EQ(child->depth, 1U);
  EXPECT_EQ(child->topology, Topology::Chain);
  EXPECT_EQ(child->child_refs().size(), 0U);
}

TEST(TypeRegistry, SecondChainChildIsNonLinear)
{
  TypeRegistry registry;
  const NodeRef v10 = registry.register_root("firmware", Topology::Chain, "1.0").node;
  const NodeRef v11 = registry.register_node(v10, "1.1").node;
  ASSERT_TRUE(registry.register_node(v11, "2.0").success());

  const NodeResult alt = registry.register_node(v11, "2.0-alt");
  ASSERT_TRUE(alt.has_error());
  EXPECT_EQ(alt.error_kind(), ErrorKind::NonLinearChain);
  EXPECT_EQ(registry.get_node(v11)->children.size(), 1U);
}

TEST(TypeRegistry, ChainChildMustBeNewer)
{
  TypeRegistry registry;
  const NodeRef v11 = registry.register_root("firmware", Topology::Chain, "1.1").node;

  const NodeResult older = registry.register_node(v11, "1.0");
  ASSERT_TRUE(older.has_error());
  EXPECT_EQ(older.error_kind(), ErrorKind::VersionOrder);

  // "1.1.0" is the same version as "1.1"
  const NodeResult same = registry.register_node(v11, "1.1.0");
  ASSERT_TRUE(same.has_error());
  EXPECT_EQ(same.error_kind(), ErrorKind::VersionOrder);

  const NodeResult garbage = registry.register_node(v11, "2.0 final");
  ASSERT_TRUE(garbage.has_error());
  EXPECT_EQ(garbage.error_kind(), ErrorKind::InvalidVersion);
}

// ============================================================================
// Tree Children
// ============================================================================

TEST(TypeRegistry, TreeAllowsDuplicateSiblingTags)
{
  TypeRegistry registry;
  const NodeRef root = registry.register_root("phone", Topology::Tree, "Phone").node;
  const NodeResult first = registry.register_node(root, "X");
  const NodeResult second = registry.register_node(root, "X");
  ASSERT_TRUE(first.success());
  ASSERT_TRUE(second.success());
  EXPECT_NE(first.node, second.node);

  const TypeNode * r = registry.get_node(root);
  ASSERT_EQ(r->children.size(), 2U);
  EXPECT_EQ(r->children[0], first.node);
  EXPECT_EQ(r->children[1], second.node);
  EXPECT_FALSE(r->version.has_value());
}

TEST(TypeRegistry, AliasesOnlyOnTreeNodes)
{
  TypeRegistry registry;
  const NodeRef phone = registry.register_root("phone", Topology::Tree, "Phone").node;
  const NodeRef fw = registry.register_root("firmware", Topology::Chain, "1.0").node;

  ASSERT_TRUE(registry.add_alias(phone, "phone").success());
  EXPECT_TRUE(registry.get_node(phone)->has_tag("phone"));
  EXPECT_TRUE(registry.get_node(phone)->has_tag("Phone"));
  EXPECT_FALSE(registry.get_node(phone)->has_tag("PHONE"));

  const NodeResult r = registry.add_alias(fw, "one");
  ASSERT_TRUE(r.has_error());
  EXPECT_EQ(r.error_kind(), ErrorKind::AliasOnChain);
}

// ============================================================================
// Lifecycle and Handles
// ============================================================================

TEST(TypeRegistry, FrozenRegistryRejectsMutation)
{
  TypeRegistry registry;
  const NodeRef root = registry.register_root("phone", Topology::Tree, "Phone").node;
  registry.freeze();
  EXPECT_TRUE(registry.is_frozen());

  EXPECT_EQ(
    registry.register_root("other", Topology::Tree, "x").error_kind(), ErrorKind::RegistryFrozen);
  EXPECT_EQ(registry.register_node(root, "iPhone").error_kind(), ErrorKind::RegistryFrozen);
  EXPECT_EQ(registry.add_alias(root, "phone").error_kind(), ErrorKind::RegistryFrozen);
  EXPECT_EQ(registry.size(), 1U);
  EXPECT_NE(registry.get_node(root), nullptr);
}

TEST(TypeRegistry, ForeignHandlesAreInvalid)
{
  TypeRegistry registry;
  EXPECT_EQ(registry.register_node(NodeRef{}, "1.0").error_kind(), ErrorKind::InvalidNode);
  EXPECT_EQ(registry.register_node(NodeRef(42), "1.0").error_kind(), ErrorKind::InvalidNode);
  EXPECT_EQ(registry.add_alias(NodeRef(42), "a").error_kind(), ErrorKind::InvalidNode);
  EXPECT_EQ(registry.get_node(NodeRef(42)), nullptr);
  EXPECT_EQ(registry.hierarchy_of(NodeRef(42)), nullptr);
}

TEST(TypeRegistry, DescribeNamesHierarchy)
{
  TypeRegistry registry;
  const NodeRef v10 = registry.register_root("firmware", Topology::Chain, "1.0").node;
  const NodeRef v11 = registry.register_node(v10, "1.1", "Ver2").node;

  EXPECT_EQ(registry.describe(v10), "'1.0' in 'firmware'");
  EXPECT_EQ(registry.describe(v11), "'1.1' (Ver2) in 'firmware'");
  EXPECT_EQ(registry.hierarchy_of(v11)->name, "firmware");
  EXPECT_EQ(registry.get_node(v11)->display_name(), "Ver2");
  EXPECT_EQ(registry.get_node(v10)->display_name(), "1.0");
}

TEST(TypeRegistry, GlobalIsASingleInstance)
{
  EXPECT_EQ(&TypeRegistry::global(), &TypeRegistry::global());
}

TEST(ErrorKind, CodesAndNamesAreDistinct)
{
  EXPECT_EQ(error_kind_to_string(ErrorKind::NonLinearChain), "NonLinearChainError");
  EXPECT_EQ(error_kind_code(ErrorKind::NonLinearChain), "E102");
  EXPECT_EQ(error_kind_code(ErrorKind::VersionNotFound), "E201");

  const Diagnostic d = to_diagnostic(ResolveError{ErrorKind::ModelNotFound, "missing"});
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E203");
  EXPECT_EQ(d.message, "missing");
}

TEST(NodeResult, ErrorKindIsEmptyOnSuccess)
{
  TypeRegistry registry;
  const NodeResult ok = registry.register_root("phone", Topology::Tree, "Phone");
  ASSERT_TRUE(ok.success());
  EXPECT_FALSE(ok.error_kind().has_value());

  const NodeResult failed = registry.register_root("phone", Topology::Tree, "Handset");
  ASSERT_TRUE(failed.error_kind().has_value());
  EXPECT_EQ(*failed.error_kind(), ErrorKind::DuplicateRoot);
}
