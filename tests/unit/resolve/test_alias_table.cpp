//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/resolve/alias_table.hpp"

#include <gtest/gtest.h>

namespace aua::resolve
{
    TEST(AliasTableTest, ImportBindingIsVisible) {
        AliasTable table;
        table.bind_import("np", "numpy");

        const auto binding = table.lookup("np");
        ASSERT_TRUE(binding.has_value());
        EXPECT_EQ(binding->state, BindingState::Origin);
        EXPECT_EQ(binding->origin, "numpy");
        EXPECT_FALSE(table.lookup("pd").has_value());
    }

    TEST(AliasTableTest, LastWriteWins) {
        AliasTable table;
        table.bind_import("np", "numpy");
        table.rebind("np");

        EXPECT_EQ(table.lookup("np")->state, BindingState::Rebound);

        table.bind_import("np", "numpy");
        EXPECT_EQ(table.lookup("np")->state, BindingState::Origin);
    }

    TEST(AliasTableTest, FunctionScopeShadowsModule) {
        AliasTable table;
        table.bind_import("np", "numpy");

        table.push_scope(ScopeKind::Function);
        EXPECT_EQ(table.depth(), 2u);
        EXPECT_EQ(table.lookup("np")->origin, "numpy");

        table.rebind("np");
        EXPECT_EQ(table.lookup("np")->state, BindingState::Rebound);

        table.pop_scope();
        EXPECT_EQ(table.lookup("np")->state, BindingState::Origin);
    }

    TEST(AliasTableTest, ClassScopeHiddenFromMethods) {
        AliasTable table;
        table.push_scope(ScopeKind::Class);
        table.bind_import("np", "numpy");
        EXPECT_TRUE(table.lookup("np").has_value());

        table.push_scope(ScopeKind::Function);
        EXPECT_FALSE(table.lookup("np").has_value());

        table.pop_scope();
        EXPECT_TRUE(table.lookup("np").has_value());
    }

    TEST(AliasTableTest, GlobalDeclarationBindsModuleScope) {
        AliasTable table;
        table.push_scope(ScopeKind::Function);
        table.declare_global("np");
        table.bind_import("np", "numpy");
        table.pop_scope();

        const auto binding = table.lookup("np");
        ASSERT_TRUE(binding.has_value());
        EXPECT_EQ(binding->origin, "numpy");
    }

    TEST(AliasTableTest, NonlocalDeclarationBindsEnclosingFunction) {
        AliasTable table;
        table.push_scope(ScopeKind::Function);
        table.bind_import("helper", "pkg.helper");

        table.push_scope(ScopeKind::Function);
        table.declare_nonlocal("helper");
        table.rebind("helper");
        table.pop_scope();

        EXPECT_EQ(table.lookup("helper")->state, BindingState::Rebound);
    }

    TEST(AliasTableTest, WalrusSkipsComprehensionScopes) {
        AliasTable table;
        table.push_scope(ScopeKind::Function);
        table.push_scope(ScopeKind::Comprehension);
        table.rebind("y", true);
        table.rebind("i");
        table.pop_scope();

        ASSERT_TRUE(table.lookup("y").has_value());
        EXPECT_EQ(table.lookup("y")->state, BindingState::Rebound);
        EXPECT_FALSE(table.lookup("i").has_value());
    }

    TEST(AliasTableTest, WildcardsVisibleFromNestedScopes) {
        AliasTable table;
        table.add_wildcard("pkg.sub");
        table.add_wildcard("other");

        table.push_scope(ScopeKind::Function);
        EXPECT_EQ(table.visible_wildcards(), (std::vector<std::string>{"other", "pkg.sub"}));
    }

    TEST(AliasTableTest, ModuleScopeCannotBePopped) {
        AliasTable table;
        table.pop_scope();
        EXPECT_EQ(table.depth(), 1u);
        EXPECT_EQ(table.current_kind(), ScopeKind::Module);
    }

    TEST(AliasTableTest, JoinMarksConflictsAmbiguous) {
        AliasTable table;
        table.bind_import("x", "pkg.x");

        const auto mark = table.open_branch();
        table.bind_import("y", "pkg.y");
        const auto left = table.rewind(mark);
        EXPECT_FALSE(table.lookup("y").has_value());

        table.rebind("y");
        table.bind_import("z", "pkg.z");
        const auto right = table.rewind(mark);

        table.close_branch(table.join(left, right));

        EXPECT_EQ(table.lookup("x")->state, BindingState::Origin);
        EXPECT_EQ(table.lookup("y")->state, BindingState::Ambiguous);
        ASSERT_TRUE(table.lookup("z").has_value());
        EXPECT_EQ(table.lookup("z")->origin, "pkg.z");
    }

    TEST(AliasTableTest, RewindRestoresOverwrittenBinding) {
        AliasTable table;
        table.bind_import("np", "numpy");

        const auto mark = table.open_branch();
        table.rebind("np");
        table.rebind("np");
        const auto branch = table.rewind(mark);

        EXPECT_EQ(table.lookup("np")->state, BindingState::Origin);
        ASSERT_EQ(branch.bindings.size(), 1u);
        EXPECT_EQ(branch.bindings.begin()->second.state, BindingState::Rebound);

        // One path rebinds, the other keeps the import.
        table.close_branch(table.join(branch, {}));
        EXPECT_EQ(table.lookup("np")->state, BindingState::Ambiguous);
    }

    TEST(AliasTableTest, SameBindingOnBothPathsIsKept) {
        AliasTable table;

        const auto mark = table.open_branch();
        table.bind_import("np", "numpy");
        const auto left = table.rewind(mark);
        table.bind_import("np", "numpy");
        const auto right = table.rewind(mark);
        table.close_branch(table.join(left, right));

        ASSERT_TRUE(table.lookup("np").has_value());
        EXPECT_EQ(table.lookup("np")->origin, "numpy");
    }

    TEST(AliasTableTest, ScopesOpenedInsideBranchAreDiscarded) {
        AliasTable table;
        const auto mark = table.open_branch();

        table.push_scope(ScopeKind::Function);
        table.bind_import("local", "pkg.local");
        table.declare_global("np");
        table.bind_import("np", "numpy");
        table.pop_scope();

        const auto branch = table.rewind(mark);
        EXPECT_FALSE(table.lookup("np").has_value());
        EXPECT_EQ(branch.bindings.size(), 1u);

        table.close_branch(branch);
        EXPECT_EQ(table.lookup("np")->origin, "numpy");
        EXPECT_FALSE(table.lookup("local").has_value());
    }

    TEST(AliasTableTest, NestedBranchesMergeIntoOuterBranch) {
        AliasTable table;
        const auto outer = table.open_branch();

        const auto inner = table.open_branch();
        table.add_wildcard("pkg");
        const auto taken = table.rewind(inner);
        table.close_branch(table.join(taken, {}));
        EXPECT_EQ(table.visible_wildcards(), std::vector<std::string>{"pkg"});

        const auto branch = table.rewind(outer);
        EXPECT_TRUE(table.visible_wildcards().empty());
        EXPECT_EQ(branch.wildcards.size(), 1u);

        table.close_branch(branch);
        EXPECT_EQ(table.visible_wildcards(), std::vector<std::string>{"pkg"});
    }

    TEST(AliasTableTest, BindingStateNames) {
        EXPECT_STREQ(to_string(BindingState::Origin), "origin");
        EXPECT_STREQ(to_string(BindingState::Ambiguous), "ambiguous");
    }
}
