#pragma once

#include "typehook/core/type_checking_extension.h"
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace typehook {
namespace core {

class HandlerRegistry;

/**
 * @brief Cursor over the extensions consulted for one hook invocation.
 *
 * Yields every global extension in insertion order, then every extension of
 * the local scope that was on top of the stack when the view was created.
 *
 * The view is not a snapshot. The global phase is index based and re-reads
 * the live size of the global collection on every step, so extensions
 * appended while the cursor is still in that phase are yielded too, each
 * exactly once. Globals appended after the cursor has moved on to the local
 * scope are yielded once the local scope is exhausted.
 *
 * A view must not outlive the registry it was created from.
 */
class DispatchView {
public:
    /**
     * @brief Advance to the next extension.
     * @return The extension, or nullptr when the view is exhausted.
     *
     * The returned pointer is a copy, so it stays valid while the extension
     * appends to the global collection.
     */
    ExtensionPtr next();

private:
    friend class HandlerRegistry;

    DispatchView(const HandlerRegistry& registry, std::shared_ptr<const ExtensionList> local)
        : registry_(&registry), local_(std::move(local)) {}

    const HandlerRegistry* registry_;
    std::shared_ptr<const ExtensionList> local_;
    std::size_t globalIndex_ = 0;
    std::size_t localIndex_ = 0;
    bool globalsExhausted_ = false;
};

/**
 * @brief Owns the extensions a dispatcher fans out to.
 *
 * Two tiers:
 *  - a global collection that lives for the whole type checking session,
 *  - a stack of local collections, one per nested scope (a closure body, an
 *    inferred block). Only the top of the stack takes part in dispatch.
 *
 * Priority is registration order: global extensions first, earliest first,
 * followed by the active local scope.
 *
 * Not thread-safe. A registry belongs to a single type checking session.
 */
class HandlerRegistry {
public:
    HandlerRegistry() = default;

    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;

    /**
     * @brief Append an extension to the global collection.
     *
     * Duplicates are kept: an extension added twice is consulted twice.
     * Safe to call from within a setup() broadcast.
     */
    void addGlobal(ExtensionPtr extension);

    /**
     * @brief Remove the first occurrence of an extension from the global collection.
     * @return true if an occurrence was removed, false if it was not registered.
     */
    bool removeGlobal(const ExtensionPtr& extension);

    /**
     * @brief Enter a nested scope with its own extensions.
     *
     * The registry shares ownership of the list until the matching popLocal();
     * changes the caller makes to the list are seen by later dispatches.
     */
    void pushLocal(std::shared_ptr<ExtensionList> extensions);

    /**
     * @brief Leave the innermost scope.
     * @throws std::logic_error if no local scope is active.
     */
    void popLocal();

    DispatchView currentView() const;

    std::size_t globalCount() const { return globals_.size(); }
    std::size_t localDepth() const { return locals_.size(); }
    bool hasLocalScope() const { return !locals_.empty(); }

    const ExtensionList& globalExtensions() const { return globals_; }

    // Top of the local scope stack, nullptr when no scope is active.
    std::shared_ptr<const ExtensionList> topLocal() const;

private:
    friend class DispatchView;

    ExtensionList globals_;
    std::vector<std::shared_ptr<ExtensionList>> locals_;
};

} // namespace core
} // namespace typehook
