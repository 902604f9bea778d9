#include "typehook/core/type_checking_session.h"
#include "typehook/utils/logging.hpp"
#include <stdexcept>
#include <utility>

namespace typehook {
namespace core {

LocalScope::LocalScope(std::shared_ptr<HandlerRegistry> registry,
                       std::shared_ptr<ExtensionList> extensions)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("LocalScope requires a handler registry");
    }
    registry_->pushLocal(std::move(extensions));
    scope_ = registry_->topLocal();
}

LocalScope::LocalScope(LocalScope&& other) noexcept
    : registry_(std::move(other.registry_)), scope_(std::move(other.scope_)) {}

LocalScope::~LocalScope() {
    if (!registry_) {
        return;
    }
    if (registry_->topLocal() == scope_) {
        registry_->popLocal();
    } else {
        THLOG_ERROR("Local extension scope is no longer on top of the stack, guard leaves it alone");
    }
}

void LocalScope::close() {
    if (!registry_) {
        return;
    }
    std::shared_ptr<HandlerRegistry> registry = std::move(registry_);
    std::shared_ptr<const ExtensionList> scope = std::move(scope_);
    if (registry->topLocal() != scope) {
        THLOG_ERROR("close() called on a local extension scope that is not on top of the stack");
        throw std::logic_error("Local extension scope is not on top of the stack");
    }
    registry->popLocal();
}

TypeCheckingSession::TypeCheckingSession(const SessionConfig& config)
    : config_(config),
      dispatcher_(std::make_shared<ExtensionDispatcher>()) {
    utils::setLogLevel(config_.logLevel);
    dispatcher_->setTraceDispatch(config_.traceDispatch);
    THLOG_DEBUG("Type checking session '" + config_.name + "' created");
}

void TypeCheckingSession::registerExtension(ExtensionPtr extension) {
    dispatcher_->addGlobal(std::move(extension));
}

bool TypeCheckingSession::unregisterExtension(const ExtensionPtr& extension) {
    return dispatcher_->removeGlobal(extension);
}

void TypeCheckingSession::begin() {
    if (begun_) {
        throw std::logic_error("Type checking session '" + config_.name + "' has already begun");
    }
    begun_ = true;
    THLOG_INFO("Starting type checking session '" + config_.name + "'");
    dispatcher_->setup();
}

void TypeCheckingSession::end() {
    if (!begun_) {
        throw std::logic_error("Type checking session '" + config_.name + "' ended before it began");
    }
    if (ended_) {
        throw std::logic_error("Type checking session '" + config_.name + "' has already ended");
    }
    ended_ = true;
    dispatcher_->finish();
    THLOG_INFO("Finished type checking session '" + config_.name + "'");
}

LocalScope TypeCheckingSession::enterScope(std::shared_ptr<ExtensionList> extensions) {
    return LocalScope(dispatcher_->sharedRegistry(), std::move(extensions));
}

} // namespace core
} // namespace typehook
