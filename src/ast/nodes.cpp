#include "typehook/ast/nodes.h"
#include <sstream>

namespace typehook {
namespace ast {

ClassNode::ClassNode(std::string name, ClassNodePtr superClass)
    : name_(std::move(name)), superClass_(std::move(superClass)) {}

const ClassNodePtr& ClassNode::objectType() {
    static const ClassNodePtr object = std::make_shared<ClassNode>("Object");
    return object;
}

MethodNode::MethodNode(std::string name,
                       ClassNodePtr returnType,
                       std::vector<ClassNodePtr> parameterTypes,
                       ClassNodePtr declaringClass)
    : name_(std::move(name)),
      returnType_(std::move(returnType)),
      parameterTypes_(std::move(parameterTypes)),
      declaringClass_(std::move(declaringClass)) {}

std::string MethodNode::getTypeDescriptor() const {
    std::ostringstream out;
    out << (returnType_ ? returnType_->getName() : "void") << ' ';
    if (declaringClass_) {
        out << declaringClass_->getName() << '.';
    }
    out << name_ << '(';
    for (std::size_t i = 0; i < parameterTypes_.size(); ++i) {
        if (i > 0) out << ", ";
        out << (parameterTypes_[i] ? parameterTypes_[i]->getName() : "?");
    }
    out << ')';
    return out.str();
}

PropertyExpression::PropertyExpression(ExpressionPtr objectExpression, std::string property, bool safe)
    : objectExpression_(std::move(objectExpression)), property_(std::move(property)), safe_(safe) {}

std::string PropertyExpression::getText() const {
    std::string receiver = objectExpression_ ? objectExpression_->getText() : "this";
    return receiver + separator() + property_;
}

std::string ArgumentListExpression::getText() const {
    std::string text = "(";
    for (std::size_t i = 0; i < expressions_.size(); ++i) {
        if (i > 0) text += ", ";
        text += expressions_[i] ? expressions_[i]->getText() : "null";
    }
    return text + ")";
}

MethodCallExpression::MethodCallExpression(ExpressionPtr objectExpression,
                                           std::string method,
                                           std::shared_ptr<ArgumentListExpression> arguments)
    : objectExpression_(std::move(objectExpression)),
      method_(std::move(method)),
      arguments_(arguments ? std::move(arguments) : std::make_shared<ArgumentListExpression>()) {}

std::string MethodCallExpression::getText() const {
    std::string receiver = objectExpression_ ? objectExpression_->getText() + "." : "";
    return receiver + method_ + arguments_->getText();
}

std::string ReturnStatement::getText() const {
    return expression_ ? "return " + expression_->getText() : "return";
}

} // namespace ast
} // namespace typehook
