#pragma once

#include "typehook/core/handler_registry.h"
#include "typehook/core/type_checking_extension.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace typehook {
namespace core {

/**
 * @brief The single extension the type checker talks to.
 *
 * Each hook fans out over the registry's current dispatch view (global
 * extensions, then the active local scope) and combines the answers:
 *
 *  - boolean hooks stop at the first extension that returns true,
 *  - handleAmbiguousMethods threads the candidate list through the
 *    extensions until at most one candidate is left,
 *  - handleMissingMethod concatenates every extension's answer,
 *  - notification hooks are delivered to every extension.
 *
 * The dispatcher is itself a TypeCheckingExtension, so one dispatcher can be
 * registered inside another and behaves there as a single extension.
 *
 * Exceptions thrown by an extension propagate to the caller; the remaining
 * extensions are not consulted for that event.
 */
class ExtensionDispatcher : public TypeCheckingExtension {
public:
    ExtensionDispatcher();

    /**
     * @throws std::invalid_argument if registry is null.
     */
    explicit ExtensionDispatcher(std::shared_ptr<HandlerRegistry> registry);

    HandlerRegistry& registry() { return *registry_; }
    const HandlerRegistry& registry() const { return *registry_; }
    const std::shared_ptr<HandlerRegistry>& sharedRegistry() const { return registry_; }

    void addGlobal(ExtensionPtr extension) { registry_->addGlobal(std::move(extension)); }
    bool removeGlobal(const ExtensionPtr& extension) { return registry_->removeGlobal(extension); }
    void pushLocal(std::shared_ptr<ExtensionList> extensions) { registry_->pushLocal(std::move(extensions)); }
    void popLocal() { registry_->popLocal(); }

    /**
     * @brief Log every claimed, narrowed or accumulated event at debug level.
     */
    void setTraceDispatch(bool enabled) { traceDispatch_ = enabled; }
    bool traceDispatch() const { return traceDispatch_; }

    void setup() override;
    void finish() override;

    bool handleUnresolvedVariableExpression(ast::VariableExpression& vexp) override;
    bool handleUnresolvedProperty(ast::PropertyExpression& pexp) override;
    bool handleUnresolvedAttribute(ast::AttributeExpression& aexp) override;
    bool handleIncompatibleAssignment(const ast::ClassNode& lhsType,
                                      const ast::ClassNode& rhsType,
                                      ast::Expression& assignmentExpression) override;
    bool handleIncompatibleReturnType(const ast::ReturnStatement& returnStatement,
                                      const ast::ClassNode& inferredReturnType) override;

    /**
     * @brief Narrow a set of equally good candidates.
     *
     * Nobody is consulted when nodes already holds at most one method.
     */
    ast::MethodNodeList handleAmbiguousMethods(const ast::MethodNodeList& nodes,
                                               const ast::Expression& origin) override;

    /**
     * @brief Collect synthesized methods from every extension, in view order.
     *
     * Null entries are dropped. A method without a declaring class is
     * attached to ast::ClassNode::objectType() before it is returned.
     */
    ast::MethodNodeList handleMissingMethod(const ast::ClassNode& receiver,
                                            const std::string& name,
                                            const ast::ArgumentListExpression& argumentList,
                                            const std::vector<ast::ClassNodePtr>& argumentTypes,
                                            const ast::MethodCall& call) override;

    bool beforeVisitMethod(const ast::MethodNode& node) override;
    void afterVisitMethod(const ast::MethodNode& node) override;
    bool beforeVisitClass(const ast::ClassNode& node) override;
    void afterVisitClass(const ast::ClassNode& node) override;
    bool beforeMethodCall(const ast::MethodCall& call) override;
    void afterMethodCall(const ast::MethodCall& call) override;
    void onMethodSelection(const ast::Expression& expression, const ast::MethodNode& target) override;

private:
    template <typename Describe, typename Hook>
    bool firstClaim(const char* hookName, Describe&& describe, Hook&& hook);

    template <typename Hook>
    void broadcast(Hook&& hook);

    std::shared_ptr<HandlerRegistry> registry_;
    bool traceDispatch_ = false;
};

} // namespace core
} // namespace typehook
