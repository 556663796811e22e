// ============================================================================
// paratask/core/logging_context.cpp - ScopedLoggingContext
// ============================================================================

#include "paratask/core/logging_context.hpp"

#include <exception>

#include "paratask/core/error.hpp"
#include "paratask/core/log.hpp"

namespace paratask {

ScopedLoggingContext::ScopedLoggingContext(LoggingContext* context) : context_(nullptr) {
    if (context == nullptr) {
        return;
    }
    try {
        context->Acquire();
        context_ = context;
    } catch (...) {
        PARATASK_LOG_ERROR("Exception creating logging context: {}", DescribeException(std::current_exception()));
    }
}

ScopedLoggingContext::~ScopedLoggingContext() {
    if (context_ == nullptr) {
        return;
    }
    try {
        context_->Release();
    } catch (...) {
        PARATASK_LOG_ERROR("Exception closing logging context: {}", DescribeException(std::current_exception()));
    }
}

}  // namespace paratask
