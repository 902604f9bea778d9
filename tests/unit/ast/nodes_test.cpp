#include <gtest/gtest.h>
#include "typehook/ast/nodes.h"
#include <memory>

using namespace typehook::ast;

TEST(NodesTest, ExpressionText) {
    auto widget = std::make_shared<VariableExpression>("widget");
    auto args = std::make_shared<ArgumentListExpression>();
    args->addExpression(std::make_shared<ConstantExpression>("1"));
    args->addExpression(std::make_shared<VariableExpression>("height"));

    EXPECT_EQ(PropertyExpression(widget, "width").getText(), "widget.width");
    EXPECT_EQ(PropertyExpression(widget, "width", true).getText(), "widget?.width");
    EXPECT_EQ(AttributeExpression(widget, "width").getText(), "widget.@width");
    EXPECT_EQ(MethodCallExpression(widget, "resize", args).getText(), "widget.resize(1, height)");
    EXPECT_EQ(MethodCallExpression(nullptr, "println", nullptr).getText(), "println()");
}

TEST(NodesTest, MethodDescriptor) {
    auto owner = std::make_shared<ClassNode>("Widget");
    auto intType = std::make_shared<ClassNode>("int");
    MethodNode resize("resize", nullptr, {intType, intType}, owner);
    EXPECT_EQ(resize.getTypeDescriptor(), "void Widget.resize(int, int)");

    resize.setDeclaringClass(nullptr);
    EXPECT_EQ(resize.getTypeDescriptor(), "void resize(int, int)");
}

TEST(NodesTest, ObjectTypeIsShared) {
    EXPECT_EQ(ClassNode::objectType(), ClassNode::objectType());
    EXPECT_EQ(ClassNode::objectType()->getName(), "Object");
}

TEST(NodesTest, ReturnStatement) {
    EXPECT_EQ(ReturnStatement(nullptr).getText(), "return");
    EXPECT_EQ(ReturnStatement(std::make_shared<VariableExpression>("x")).getText(), "return x");
}
