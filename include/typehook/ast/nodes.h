#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace typehook {
namespace ast {

/**
 * @brief The AST surface the extension hooks are expressed in.
 *
 * These are the node types a type checker hands to extensions. Only the
 * information an extension needs to recognise an event is modelled here:
 * names, types and the shape of call sites.
 */

class ClassNode;
class MethodNode;
class Expression;
class ArgumentListExpression;

using ClassNodePtr = std::shared_ptr<ClassNode>;
using MethodNodePtr = std::shared_ptr<MethodNode>;
using MethodNodeList = std::vector<MethodNodePtr>;
using ExpressionPtr = std::shared_ptr<Expression>;

class ClassNode {
public:
    explicit ClassNode(std::string name, ClassNodePtr superClass = nullptr);

    const std::string& getName() const { return name_; }
    const ClassNodePtr& getSuperClass() const { return superClass_; }

    /**
     * @brief The generic root owner every class ultimately derives from.
     *
     * Synthesized methods that come back from an extension without a
     * declaring class are attached to this node.
     */
    static const ClassNodePtr& objectType();

private:
    std::string name_;
    ClassNodePtr superClass_;
};

class MethodNode {
public:
    MethodNode(std::string name,
               ClassNodePtr returnType,
               std::vector<ClassNodePtr> parameterTypes = {},
               ClassNodePtr declaringClass = nullptr);

    const std::string& getName() const { return name_; }
    const ClassNodePtr& getReturnType() const { return returnType_; }
    const std::vector<ClassNodePtr>& getParameterTypes() const { return parameterTypes_; }

    const ClassNodePtr& getDeclaringClass() const { return declaringClass_; }
    void setDeclaringClass(ClassNodePtr declaringClass) { declaringClass_ = std::move(declaringClass); }

    // e.g. "String Foo.bar(int, String)"
    std::string getTypeDescriptor() const;

private:
    std::string name_;
    ClassNodePtr returnType_;
    std::vector<ClassNodePtr> parameterTypes_;
    ClassNodePtr declaringClass_;
};

class Expression {
public:
    virtual ~Expression() = default;
    virtual std::string getText() const = 0;

    // Type inferred by the checker so far, null when not yet known.
    const ClassNodePtr& getType() const { return type_; }
    void setType(ClassNodePtr type) { type_ = std::move(type); }

private:
    ClassNodePtr type_;
};

class ConstantExpression : public Expression {
public:
    explicit ConstantExpression(std::string value) : value_(std::move(value)) {}
    const std::string& getValue() const { return value_; }
    std::string getText() const override { return value_; }

private:
    std::string value_;
};

class VariableExpression : public Expression {
public:
    explicit VariableExpression(std::string name) : name_(std::move(name)) {}
    const std::string& getName() const { return name_; }
    std::string getText() const override { return name_; }

private:
    std::string name_;
};

class PropertyExpression : public Expression {
public:
    PropertyExpression(ExpressionPtr objectExpression, std::string property, bool safe = false);

    const ExpressionPtr& getObjectExpression() const { return objectExpression_; }
    const std::string& getPropertyAsString() const { return property_; }
    bool isSafe() const { return safe_; }
    std::string getText() const override;

protected:
    virtual const char* separator() const { return safe_ ? "?." : "."; }

private:
    ExpressionPtr objectExpression_;
    std::string property_;
    bool safe_;
};

// Direct field access: obj.@field
class AttributeExpression : public PropertyExpression {
public:
    using PropertyExpression::PropertyExpression;

protected:
    const char* separator() const override { return isSafe() ? "?.@" : ".@"; }
};

class ArgumentListExpression : public Expression {
public:
    ArgumentListExpression() = default;
    explicit ArgumentListExpression(std::vector<ExpressionPtr> expressions)
        : expressions_(std::move(expressions)) {}

    const std::vector<ExpressionPtr>& getExpressions() const { return expressions_; }
    void addExpression(ExpressionPtr expression) { expressions_.push_back(std::move(expression)); }
    std::size_t size() const { return expressions_.size(); }
    std::string getText() const override;

private:
    std::vector<ExpressionPtr> expressions_;
};

/**
 * @brief Common view over every kind of call site (method, static, constructor).
 */
class MethodCall {
public:
    virtual ~MethodCall() = default;
    virtual ExpressionPtr getReceiver() const = 0;
    virtual std::string getMethodAsString() const = 0;
    virtual std::shared_ptr<ArgumentListExpression> getArguments() const = 0;
    virtual std::string getText() const = 0;
};

class MethodCallExpression : public Expression, public MethodCall {
public:
    MethodCallExpression(ExpressionPtr objectExpression,
                         std::string method,
                         std::shared_ptr<ArgumentListExpression> arguments);

    ExpressionPtr getReceiver() const override { return objectExpression_; }
    std::string getMethodAsString() const override { return method_; }
    std::shared_ptr<ArgumentListExpression> getArguments() const override { return arguments_; }
    std::string getText() const override;

private:
    ExpressionPtr objectExpression_;
    std::string method_;
    std::shared_ptr<ArgumentListExpression> arguments_;
};

class ReturnStatement {
public:
    explicit ReturnStatement(ExpressionPtr expression) : expression_(std::move(expression)) {}

    const ExpressionPtr& getExpression() const { return expression_; }
    std::string getText() const;

private:
    ExpressionPtr expression_;
};

} // namespace ast
} // namespace typehook
