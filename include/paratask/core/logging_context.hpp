// ============================================================================
// paratask/core/logging_context.hpp - Scoped Correlation Context
// ============================================================================
//
// Pipeline stages run on pool workers, far from the thread that built the
// group. A LoggingContext lets the caller carry correlation data (request
// ids, MDC-style fields) onto those workers: the group acquires it before
// every stage it runs and releases it on every exit path. The core never
// looks inside.
//
// USAGE:
// ------
//   class RequestContext : public LoggingContext {
//      public:
//       void Acquire() override { tls_request_id = id_; }
//       void Release() override { tls_request_id.clear(); }
//       ...
//   };
//
//   TaskGroup<std::string>::Options options;
//   options.logging_context = std::make_shared<RequestContext>(id);
//
// ============================================================================

#pragma once

namespace paratask {

class LoggingContext {
   public:
    virtual ~LoggingContext() = default;

    // Install the context on the calling thread
    virtual void Acquire() = 0;

    // Remove it again; called once per successful Acquire()
    virtual void Release() = 0;
};

// RAII guard around one stage. A null context is a no-op. Failures of
// Acquire()/Release() are logged and never escape; a failed Acquire() is not
// paired with a Release().
class ScopedLoggingContext {
   public:
    explicit ScopedLoggingContext(LoggingContext* context);
    ~ScopedLoggingContext();

    ScopedLoggingContext(const ScopedLoggingContext&) = delete;
    ScopedLoggingContext& operator=(const ScopedLoggingContext&) = delete;

    bool IsAcquired() const noexcept { return context_ != nullptr; }

   private:
    LoggingContext* context_;
};

}  // namespace paratask
