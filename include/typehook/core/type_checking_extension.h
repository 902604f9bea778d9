#pragma once

#include "typehook/ast/nodes.h"
#include <memory>
#include <string>
#include <vector>

namespace typehook {
namespace core {

/**
 * @brief Base class for every type checking extension.
 *
 * A type checker raises a fixed set of events while it visits a program. An
 * extension overrides the hooks it is interested in and inherits a neutral
 * answer for all the others, so a dispatcher can call every hook on every
 * registered extension without asking which ones it "really" implements.
 *
 * Neutral answers:
 *  - boolean hooks return false ("not handled"),
 *  - handleAmbiguousMethods returns its input unchanged,
 *  - handleMissingMethod returns an empty list,
 *  - notification hooks do nothing.
 *
 * Hooks are called synchronously from the type checker's thread. An
 * exception thrown from a hook is not caught by the dispatcher.
 */
class TypeCheckingExtension {
public:
    virtual ~TypeCheckingExtension() = default;

    /**
     * @brief Called once before type checking starts.
     *
     * This is the only hook from which an extension may register further
     * global extensions; they are set up within the same broadcast.
     */
    virtual void setup() {}

    /**
     * @brief Called once after type checking has completed.
     */
    virtual void finish() {}

    /**
     * @brief A variable could not be resolved.
     * @param vexp The unresolved variable.
     * @return true if the extension took responsibility for the variable.
     */
    virtual bool handleUnresolvedVariableExpression(ast::VariableExpression& vexp);

    /**
     * @brief A property could not be resolved on its receiver.
     * @return true if the extension took responsibility for the property.
     */
    virtual bool handleUnresolvedProperty(ast::PropertyExpression& pexp);

    /**
     * @brief A direct field access (obj.@field) could not be resolved.
     * @return true if the extension took responsibility for the attribute.
     */
    virtual bool handleUnresolvedAttribute(ast::AttributeExpression& aexp);

    /**
     * @brief The right hand side type cannot be assigned to the left hand side type.
     * @return true if the assignment should be accepted without an error.
     */
    virtual bool handleIncompatibleAssignment(const ast::ClassNode& lhsType,
                                              const ast::ClassNode& rhsType,
                                              ast::Expression& assignmentExpression);

    /**
     * @brief The inferred type of a return statement does not match the method signature.
     * @return true if the return should be accepted without an error.
     */
    virtual bool handleIncompatibleReturnType(const ast::ReturnStatement& returnStatement,
                                              const ast::ClassNode& inferredReturnType);

    /**
     * @brief Several methods match a call equally well.
     * @param nodes Current candidates.
     * @param origin The call site.
     * @return The candidates that remain; nodes unchanged when the extension has no opinion.
     */
    virtual ast::MethodNodeList handleAmbiguousMethods(const ast::MethodNodeList& nodes,
                                                       const ast::Expression& origin);

    /**
     * @brief No method matched a call.
     *
     * Returned methods may leave their declaring class unset; the dispatcher
     * attaches them to ast::ClassNode::objectType().
     *
     * @return Synthesized methods the call may resolve to, empty when unknown.
     */
    virtual ast::MethodNodeList handleMissingMethod(const ast::ClassNode& receiver,
                                                    const std::string& name,
                                                    const ast::ArgumentListExpression& argumentList,
                                                    const std::vector<ast::ClassNodePtr>& argumentTypes,
                                                    const ast::MethodCall& call);

    /**
     * @return true to tell the type checker to skip the method body.
     */
    virtual bool beforeVisitMethod(const ast::MethodNode& node);
    virtual void afterVisitMethod(const ast::MethodNode& node) {}

    /**
     * @return true to tell the type checker to skip the class.
     */
    virtual bool beforeVisitClass(const ast::ClassNode& node);
    virtual void afterVisitClass(const ast::ClassNode& node) {}

    /**
     * @return true to tell the type checker the call has been checked already.
     */
    virtual bool beforeMethodCall(const ast::MethodCall& call);
    virtual void afterMethodCall(const ast::MethodCall& call) {}

    // A target method has been chosen for a call or method reference.
    virtual void onMethodSelection(const ast::Expression& expression, const ast::MethodNode& target) {}
};

using ExtensionPtr = std::shared_ptr<TypeCheckingExtension>;
using ExtensionList = std::vector<ExtensionPtr>;

} // namespace core
} // namespace typehook
