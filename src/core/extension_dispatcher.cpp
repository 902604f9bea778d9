#include "typehook/core/extension_dispatcher.h"
#include "typehook/utils/logging.hpp"
#include <stdexcept>

namespace typehook {
namespace core {

ExtensionDispatcher::ExtensionDispatcher()
    : registry_(std::make_shared<HandlerRegistry>()) {}

ExtensionDispatcher::ExtensionDispatcher(std::shared_ptr<HandlerRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("ExtensionDispatcher requires a handler registry");
    }
}

template <typename Describe, typename Hook>
bool ExtensionDispatcher::firstClaim(const char* hookName, Describe&& describe, Hook&& hook) {
    DispatchView view = registry_->currentView();
    std::size_t position = 0;
    while (ExtensionPtr handler = view.next()) {
        if (hook(*handler)) {
            if (traceDispatch_) {
                THLOG_DEBUG(std::string(hookName) + "(" + describe() + ") claimed by extension #" +
                            std::to_string(position));
            }
            return true;
        }
        ++position;
    }
    return false;
}

template <typename Hook>
void ExtensionDispatcher::broadcast(Hook&& hook) {
    DispatchView view = registry_->currentView();
    while (ExtensionPtr handler = view.next()) {
        hook(*handler);
    }
}

void ExtensionDispatcher::setup() {
    // Extensions may register further global extensions from setup(); the
    // view picks them up before this broadcast returns.
    broadcast([](TypeCheckingExtension& handler) { handler.setup(); });
    THLOG_INFO("Extension setup complete, " + std::to_string(registry_->globalCount()) +
               " global extensions active");
}

void ExtensionDispatcher::finish() {
    broadcast([](TypeCheckingExtension& handler) { handler.finish(); });
}

bool ExtensionDispatcher::handleUnresolvedVariableExpression(ast::VariableExpression& vexp) {
    return firstClaim("handleUnresolvedVariableExpression",
                      [&vexp] { return vexp.getText(); },
                      [&vexp](TypeCheckingExtension& handler) {
                          return handler.handleUnresolvedVariableExpression(vexp);
                      });
}

bool ExtensionDispatcher::handleUnresolvedProperty(ast::PropertyExpression& pexp) {
    return firstClaim("handleUnresolvedProperty",
                      [&pexp] { return pexp.getText(); },
                      [&pexp](TypeCheckingExtension& handler) {
                          return handler.handleUnresolvedProperty(pexp);
                      });
}

bool ExtensionDispatcher::handleUnresolvedAttribute(ast::AttributeExpression& aexp) {
    return firstClaim("handleUnresolvedAttribute",
                      [&aexp] { return aexp.getText(); },
                      [&aexp](TypeCheckingExtension& handler) {
                          return handler.handleUnresolvedAttribute(aexp);
                      });
}

bool ExtensionDispatcher::handleIncompatibleAssignment(const ast::ClassNode& lhsType,
                                                       const ast::ClassNode& rhsType,
                                                       ast::Expression& assignmentExpression) {
    return firstClaim("handleIncompatibleAssignment",
                      [&] { return lhsType.getName() + " <- " + rhsType.getName(); },
                      [&](TypeCheckingExtension& handler) {
                          return handler.handleIncompatibleAssignment(lhsType, rhsType, assignmentExpression);
                      });
}

bool ExtensionDispatcher::handleIncompatibleReturnType(const ast::ReturnStatement& returnStatement,
                                                       const ast::ClassNode& inferredReturnType) {
    return firstClaim("handleIncompatibleReturnType",
                      [&] { return returnStatement.getText() + " : " + inferredReturnType.getName(); },
                      [&](TypeCheckingExtension& handler) {
                          return handler.handleIncompatibleReturnType(returnStatement, inferredReturnType);
                      });
}

ast::MethodNodeList ExtensionDispatcher::handleAmbiguousMethods(const ast::MethodNodeList& nodes,
                                                                const ast::Expression& origin) {
    ast::MethodNodeList result = nodes;
    DispatchView view = registry_->currentView();
    while (result.size() > 1) {
        ExtensionPtr handler = view.next();
        if (!handler) {
            break;
        }
        result = handler->handleAmbiguousMethods(result, origin);
    }
    if (traceDispatch_ && result.size() != nodes.size()) {
        THLOG_DEBUG("handleAmbiguousMethods(" + origin.getText() + ") narrowed " +
                    std::to_string(nodes.size()) + " candidates to " + std::to_string(result.size()));
    }
    return result;
}

ast::MethodNodeList ExtensionDispatcher::handleMissingMethod(const ast::ClassNode& receiver,
                                                             const std::string& name,
                                                             const ast::ArgumentListExpression& argumentList,
                                                             const std::vector<ast::ClassNodePtr>& argumentTypes,
                                                             const ast::MethodCall& call) {
    ast::MethodNodeList result;
    DispatchView view = registry_->currentView();
    while (ExtensionPtr handler = view.next()) {
        ast::MethodNodeList handlerResult =
            handler->handleMissingMethod(receiver, name, argumentList, argumentTypes, call);
        for (auto& method : handlerResult) {
            if (!method) {
                continue;
            }
            if (!method->getDeclaringClass()) {
                method->setDeclaringClass(ast::ClassNode::objectType());
            }
            result.push_back(std::move(method));
        }
    }
    if (traceDispatch_ && !result.empty()) {
        THLOG_DEBUG("handleMissingMethod(" + receiver.getName() + "." + name + ") collected " +
                    std::to_string(result.size()) + " synthesized methods");
    }
    return result;
}

bool ExtensionDispatcher::beforeVisitMethod(const ast::MethodNode& node) {
    return firstClaim("beforeVisitMethod",
                      [&node] { return node.getTypeDescriptor(); },
                      [&node](TypeCheckingExtension& handler) { return handler.beforeVisitMethod(node); });
}

void ExtensionDispatcher::afterVisitMethod(const ast::MethodNode& node) {
    broadcast([&node](TypeCheckingExtension& handler) { handler.afterVisitMethod(node); });
}

bool ExtensionDispatcher::beforeVisitClass(const ast::ClassNode& node) {
    return firstClaim("beforeVisitClass",
                      [&node] { return node.getName(); },
                      [&node](TypeCheckingExtension& handler) { return handler.beforeVisitClass(node); });
}

void ExtensionDispatcher::afterVisitClass(const ast::ClassNode& node) {
    broadcast([&node](TypeCheckingExtension& handler) { handler.afterVisitClass(node); });
}

bool ExtensionDispatcher::beforeMethodCall(const ast::MethodCall& call) {
    return firstClaim("beforeMethodCall",
                      [&call] { return call.getText(); },
                      [&call](TypeCheckingExtension& handler) { return handler.beforeMethodCall(call); });
}

void ExtensionDispatcher::afterMethodCall(const ast::MethodCall& call) {
    broadcast([&call](TypeCheckingExtension& handler) { handler.afterMethodCall(call); });
}

void ExtensionDispatcher::onMethodSelection(const ast::Expression& expression, const ast::MethodNode& target) {
    broadcast([&](TypeCheckingExtension& handler) { handler.onMethodSelection(expression, target); });
}

} // namespace core
} // namespace typehook
