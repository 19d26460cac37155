/// @file admission_ticket.cpp
/// @brief AdmissionTicket implementation.

#include "sgov/governor/admission_ticket.hpp"

#include <new>

#include "sgov/foundation/governor_logger.hpp"

namespace sgov::governor {

AdmissionTicket::AdmissionTicket(SourceGovernor& governor, std::string_view source)
    : governor_(&governor), source_(source) {}

AdmissionTicket::~AdmissionTicket() {
    abandon();
}

AdmissionTicket::AdmissionTicket(AdmissionTicket&& other) noexcept
    : governor_(std::exchange(other.governor_, nullptr)),
      source_(std::move(other.source_)) {}

AdmissionTicket& AdmissionTicket::operator=(AdmissionTicket&& other) noexcept {
    if (this != &other) {
        abandon();
        governor_ = std::exchange(other.governor_, nullptr);
        source_ = std::move(other.source_);
    }
    return *this;
}

void AdmissionTicket::succeed() {
    if (auto* governor = std::exchange(governor_, nullptr)) {
        governor->reportSuccess(source_);
    }
}

void AdmissionTicket::fail(std::optional<int> statusCode) {
    if (auto* governor = std::exchange(governor_, nullptr)) {
        governor->reportFailure(source_, statusCode);
    }
}

void AdmissionTicket::abandon() noexcept {
    auto* governor = std::exchange(governor_, nullptr);
    if (governor == nullptr) {
        return;
    }

    // Release the slot before anything that may allocate.
    governor->reportFailure(source_);

    try {
        foundation::GovernorError error(
            foundation::ErrorCode::AdmissionAbandoned,
            "admission dropped without a report; recorded a failure");
        auto& logger = foundation::GovernorLogger::instance();
        if (logger.isEnabled(foundation::LogLevel::Warning, foundation::LogCategory::Core)) {
            foundation::LogContext ctx;
            ctx.source = source_;
            ctx.extra["subsystem"] = std::string(error.subsystem());
            logger.logWithContext(foundation::LogLevel::Warning,
                                  foundation::LogCategory::Core, error.message(), ctx);
        }
    } catch (const std::bad_alloc&) {
        // The failure is already recorded; only the warning is lost.
    }
}

} // namespace sgov::governor
