#pragma once

#include "typehook/core/extension_dispatcher.h"
#include "typehook/core/session_config.h"
#include <memory>

/*
 * @file type_checking_session.h
 * @brief Session facade bracketing one type checking run.
 *
 * A TypeCheckingSession owns the ExtensionDispatcher the type checker calls
 * for one compilation unit. It is created at the start of type checking and
 * discarded at the end; nothing here is process-wide.
 *
 * Related components:
 *  - HandlerRegistry: global extensions and the local scope stack.
 *  - ExtensionDispatcher: per-hook aggregation over the registry.
 *  - LocalScope: pairs pushLocal() with popLocal() for a nested scope.
 */

namespace typehook {
namespace core {

/**
 * @class LocalScope
 * @brief Keeps a set of local extensions active for the lifetime of the guard.
 *
 * Pushes on construction and pops on destruction (or on close()). Moving a
 * guard transfers the obligation to pop; a moved-from guard does nothing.
 * Guards must be destroyed in the reverse order of their creation.
 *
 * The guard shares ownership of the registry, so it may outlive the session
 * that created it. It only ever pops the scope it pushed: if that scope is no
 * longer on top of the stack, the guard logs an error and leaves the stack
 * untouched.
 */
class LocalScope {
public:
    /**
     * @throws std::invalid_argument if registry is null.
     */
    LocalScope(std::shared_ptr<HandlerRegistry> registry, std::shared_ptr<ExtensionList> extensions);
    ~LocalScope();

    LocalScope(LocalScope&& other) noexcept;
    LocalScope& operator=(LocalScope&& other) = delete;
    LocalScope(const LocalScope&) = delete;
    LocalScope& operator=(const LocalScope&) = delete;

    /**
     * @brief Pop the scope now instead of at destruction.
     * @throws std::logic_error if the scope this guard pushed is not on top
     *         of the local scope stack.
     */
    void close();

    bool isOpen() const { return registry_ != nullptr; }

private:
    std::shared_ptr<HandlerRegistry> registry_;
    std::shared_ptr<const ExtensionList> scope_;
};

/**
 * @class TypeCheckingSession
 * @brief Lifetime of the extension machinery for one type checking run.
 */
class TypeCheckingSession {
public:
    /**
     * @brief Construct a session and apply the configured log level.
     * @param config Session configuration.
     */
    explicit TypeCheckingSession(const SessionConfig& config = SessionConfig());
    ~TypeCheckingSession() = default;

    TypeCheckingSession(const TypeCheckingSession&) = delete;
    TypeCheckingSession& operator=(const TypeCheckingSession&) = delete;

    /**
     * @brief Register an extension before (or during) setup.
     */
    void registerExtension(ExtensionPtr extension);

    /**
     * @brief Remove a previously registered extension.
     * @return true if it was registered.
     */
    bool unregisterExtension(const ExtensionPtr& extension);

    /**
     * @brief Broadcast setup() to every registered extension.
     * @throws std::logic_error if the session has already begun.
     */
    void begin();

    /**
     * @brief Broadcast finish() to every registered extension.
     * @throws std::logic_error if begin() was not called, or end() was already called.
     */
    void end();

    bool hasBegun() const { return begun_; }
    bool hasEnded() const { return ended_; }

    /**
     * @brief Activate local extensions for a nested scope (a closure body).
     * @return Guard that deactivates them when it goes out of scope.
     */
    LocalScope enterScope(std::shared_ptr<ExtensionList> extensions);

    ExtensionDispatcher& dispatcher() { return *dispatcher_; }
    const SessionConfig& config() const { return config_; }

private:
    SessionConfig config_;
    std::shared_ptr<ExtensionDispatcher> dispatcher_;
    bool begun_ = false;
    bool ended_ = false;
};

} // namespace core
} // namespace typehook
