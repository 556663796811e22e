// ============================================================================
// paratask/core/error.cpp - Error Category Implementation
// ============================================================================

#include "paratask/core/error.hpp"

#include <stdexcept>
#include <string>

namespace paratask {

namespace {

class ParataskCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "paratask"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::AlreadyStarted:
                return "Task group already started";
            case Errc::NoTasks:
                return "No tasks defined";
            case Errc::NoResult:
                return "No successful result found";
            case Errc::AmbiguousResult:
                return "More than one successful result found";
            case Errc::EmptyResult:
                return "Successful result carries no value";
            case Errc::InvalidArgument:
                return "Invalid argument";
            case Errc::ExecutorStopped:
                return "Executor is not running";
            default:
                return "Unknown paratask error";
        }
    }
};

}  // namespace

const std::error_category& ParataskCategory() noexcept {
    static const ParataskCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), ParataskCategory()};
}

std::string DescribeException(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

}  // namespace paratask
