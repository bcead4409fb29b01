#include <gtest/gtest.h>

#include "ClariceError.hpp"
#include "environment.hpp"

static Token at(const std::string& name) {
    return Token(TokenType::IDENTIFIER, name, TokenLocation("<test>", 1, 1, static_cast<int>(name.size())));
}

TEST(ScopeTest, LookupWalksOutward) {
    Environment global(nullptr);
    global.bind("x", std::int64_t{1}, Durability::Durable, at("x"));

    EnvPtr child = global.push_scope();
    EnvPtr grandchild = child->push_scope();
    EXPECT_EQ(std::get<std::int64_t>(grandchild->lookup("x", at("x"))), 1);
    EXPECT_EQ(grandchild->depth(), 2u);
}

TEST(ScopeTest, UnknownNameIsNameError) {
    Environment global(nullptr);
    EXPECT_THROW(global.lookup("missing", at("missing")), NameError);
}

TEST(ScopeTest, InnerBindingShadowsOuter) {
    Environment global(nullptr);
    global.bind("x", std::int64_t{1}, Durability::Durable, at("x"));
    {
        ScopeGuard guard(global);
        guard.scope()->bind("x", std::string("inner"), Durability::Durable, at("x"));
        EXPECT_EQ(std::get<std::string>(guard.scope()->lookup("x", at("x"))), "inner");
    }
    EXPECT_EQ(std::get<std::int64_t>(global.lookup("x", at("x"))), 1);
}

TEST(ScopeTest, DurableRedeclarationInSameScopeFails) {
    Environment global(nullptr);
    global.bind("x", std::monostate{}, Durability::Durable, at("x"));
    EXPECT_THROW(global.bind("x", std::monostate{}, Durability::Durable, at("x")), NameError);
}

TEST(ScopeTest, TransientBindingReplaces) {
    Environment global(nullptr);
    global.bind("x", std::int64_t{1}, Durability::Transient, at("x"));
    EXPECT_NO_THROW(global.bind("x", std::int64_t{2}, Durability::Transient, at("x")));
    EXPECT_EQ(std::get<std::int64_t>(global.lookup("x", at("x"))), 2);
}

TEST(ScopeTest, RebindUpdatesNearestAndKeepsDurability) {
    Environment global(nullptr);
    global.bind("x", std::monostate{}, Durability::Durable, at("x"));
    EnvPtr child = global.push_scope();
    child->rebind("x", std::int64_t{3}, at("x"));

    EXPECT_FALSE(child->has_local("x"));
    const Environment::Binding* b = global.find("x");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(std::get<std::int64_t>(b->value), 3);
    EXPECT_EQ(b->durability, Durability::Durable);
}

TEST(ScopeTest, RebindOfUndeclaredNameFails) {
    Environment global(nullptr);
    try {
        global.rebind("y", std::int64_t{1}, at("y"));
        FAIL() << "expected NameError";
    } catch (const NameError& e) {
        EXPECT_NE(e.detail().find("let y"), std::string::npos);
    }
}

TEST(ScopeTest, GuardPopsBindingsWhenUnwinding) {
    Environment global(nullptr);
    EnvPtr kept;
    try {
        ScopeGuard guard(global);
        kept = guard.scope();
        guard.scope()->bind("t", std::int64_t{1}, Durability::Transient, at("t"));
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    ASSERT_NE(kept, nullptr);
    EXPECT_TRUE(kept->bindings().empty());
    EXPECT_FALSE(global.has("t"));
}
