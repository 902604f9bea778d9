#include "typehook/core/handler_registry.h"
#include "typehook/utils/logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace typehook {
namespace core {

ExtensionPtr DispatchView::next() {
    const ExtensionList& globals = registry_->globals_;
    if (!globalsExhausted_) {
        if (globalIndex_ < globals.size()) {
            return globals[globalIndex_++];
        }
        globalsExhausted_ = true;
    }
    if (local_ && localIndex_ < local_->size()) {
        return (*local_)[localIndex_++];
    }
    // Globals appended while the local scope was being walked.
    if (globalIndex_ < globals.size()) {
        return globals[globalIndex_++];
    }
    return nullptr;
}

void HandlerRegistry::addGlobal(ExtensionPtr extension) {
    globals_.push_back(std::move(extension));
    THLOG_DEBUG("Registered global extension, " + std::to_string(globals_.size()) + " now active");
}

bool HandlerRegistry::removeGlobal(const ExtensionPtr& extension) {
    auto it = std::find(globals_.begin(), globals_.end(), extension);
    if (it == globals_.end()) {
        return false;
    }
    globals_.erase(it);
    THLOG_DEBUG("Removed global extension, " + std::to_string(globals_.size()) + " remain");
    return true;
}

void HandlerRegistry::pushLocal(std::shared_ptr<ExtensionList> extensions) {
    if (!extensions) {
        extensions = std::make_shared<ExtensionList>();
    }
    locals_.push_back(std::move(extensions));
}

void HandlerRegistry::popLocal() {
    if (locals_.empty()) {
        THLOG_ERROR("popLocal() called without a matching pushLocal()");
        throw std::logic_error("No local extension scope to pop");
    }
    locals_.pop_back();
}

DispatchView HandlerRegistry::currentView() const {
    return DispatchView(*this, topLocal());
}

std::shared_ptr<const ExtensionList> HandlerRegistry::topLocal() const {
    if (locals_.empty()) {
        return nullptr;
    }
    return locals_.back();
}

} // namespace core
} // namespace typehook
