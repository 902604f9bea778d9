#include "typehook/core/type_checking_session.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace typehook;
using namespace typehook::core;

namespace {

// Treats any unresolved variable starting with "env_" as a String.
class EnvironmentVariables : public TypeCheckingExtension {
public:
    bool handleUnresolvedVariableExpression(ast::VariableExpression& vexp) override {
        if (vexp.getName().rfind("env_", 0) != 0) {
            return false;
        }
        vexp.setType(std::make_shared<ast::ClassNode>("String"));
        return true;
    }
};

// Inside a builder closure every missing method becomes a builder call.
class BuilderDelegate : public TypeCheckingExtension {
public:
    ast::MethodNodeList handleMissingMethod(const ast::ClassNode&,
                                            const std::string& name,
                                            const ast::ArgumentListExpression&,
                                            const std::vector<ast::ClassNodePtr>& argumentTypes,
                                            const ast::MethodCall&) override {
        return {std::make_shared<ast::MethodNode>(name, ast::ClassNode::objectType(), argumentTypes)};
    }
};

} // namespace

int main(int argc, char** argv) {
    SessionConfig config;
    config.name = "example";
    config.logLevel = utils::LogLevel::Info;

    if (argc > 1) {
        auto loaded = loadSessionConfig(argv[1]);
        if (!loaded) {
            std::cerr << "Cannot use " << argv[1] << ": " << loaded.error().message << "\n";
            return 1;
        }
        config = loaded.value();
    }

    TypeCheckingSession session(config);
    session.registerExtension(std::make_shared<EnvironmentVariables>());
    session.begin();

    ExtensionDispatcher& dispatcher = session.dispatcher();

    ast::VariableExpression home("env_HOME");
    ast::VariableExpression typo("countr");
    std::cout << home.getText() << " handled: " << dispatcher.handleUnresolvedVariableExpression(home) << "\n";
    std::cout << typo.getText() << " handled: " << dispatcher.handleUnresolvedVariableExpression(typo) << "\n";

    auto receiver = std::make_shared<ast::VariableExpression>("html");
    auto arguments = std::make_shared<ast::ArgumentListExpression>();
    arguments->addExpression(std::make_shared<ast::ConstantExpression>("\"title\""));
    ast::MethodCallExpression call(receiver, "head", arguments);
    ast::ClassNode builderType("MarkupBuilder");
    std::vector<ast::ClassNodePtr> argumentTypes = {std::make_shared<ast::ClassNode>("String")};

    auto outside = dispatcher.handleMissingMethod(builderType, "head", *arguments, argumentTypes, call);
    std::cout << call.getText() << " outside closure: " << outside.size() << " candidates\n";

    {
        auto scope = session.enterScope(std::make_shared<ExtensionList>(
            ExtensionList{std::make_shared<BuilderDelegate>()}));
        auto inside = dispatcher.handleMissingMethod(builderType, "head", *arguments, argumentTypes, call);
        for (const auto& method : inside) {
            std::cout << call.getText() << " inside closure: " << method->getTypeDescriptor() << "\n";
        }
    }

    session.end();
    return 0;
}
