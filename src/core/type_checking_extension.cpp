#include "typehook/core/type_checking_extension.h"

namespace typehook {
namespace core {

bool TypeCheckingExtension::handleUnresolvedVariableExpression(ast::VariableExpression&) {
    return false;
}

bool TypeCheckingExtension::handleUnresolvedProperty(ast::PropertyExpression&) {
    return false;
}

bool TypeCheckingExtension::handleUnresolvedAttribute(ast::AttributeExpression&) {
    return false;
}

bool TypeCheckingExtension::handleIncompatibleAssignment(const ast::ClassNode&,
                                                         const ast::ClassNode&,
                                                         ast::Expression&) {
    return false;
}

bool TypeCheckingExtension::handleIncompatibleReturnType(const ast::ReturnStatement&,
                                                         const ast::ClassNode&) {
    return false;
}

ast::MethodNodeList TypeCheckingExtension::handleAmbiguousMethods(const ast::MethodNodeList& nodes,
                                                                  const ast::Expression&) {
    return nodes;
}

ast::MethodNodeList TypeCheckingExtension::handleMissingMethod(const ast::ClassNode&,
                                                               const std::string&,
                                                               const ast::ArgumentListExpression&,
                                                               const std::vector<ast::ClassNodePtr>&,
                                                               const ast::MethodCall&) {
    return {};
}

bool TypeCheckingExtension::beforeVisitMethod(const ast::MethodNode&) {
    return false;
}

bool TypeCheckingExtension::beforeVisitClass(const ast::ClassNode&) {
    return false;
}

bool TypeCheckingExtension::beforeMethodCall(const ast::MethodCall&) {
    return false;
}

} // namespace core
} // namespace typehook
