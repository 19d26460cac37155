#pragma once

/// @file admission_ticket.hpp
/// @brief Move-only proof of admission that reports its outcome exactly once.

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "sgov/foundation/governor_result.hpp"
#include "sgov/governor/source_governor.hpp"

namespace sgov::governor {

/// One admitted call against a source.
///
/// Obtained from SourceGovernor::admit(). Calling succeed() or fail()
/// reports the outcome and releases the slot; later calls are ignored.
/// A ticket destroyed without a report counts as a failed call and logs
/// a warning, so an early return or a caller that gave up never leaks the
/// slot silently.
///
/// Destruction and move assignment are noexcept. The abandon warning is
/// dropped if it cannot be allocated; the failure report itself still
/// runs, and an allocation failure inside the governor's own logging
/// terminates the process.
///
/// Example:
/// @code
///   auto ticket = governor.admit("goplus");
///   if (!ticket) {
///       return fallback;
///   }
///   auto response = client.get(url);
///   if (response.status == 200) {
///       ticket.value().succeed();
///   } else {
///       ticket.value().fail(response.status);
///   }
/// @endcode
class AdmissionTicket {
public:
    ~AdmissionTicket();

    AdmissionTicket(AdmissionTicket&& other) noexcept;
    AdmissionTicket& operator=(AdmissionTicket&& other) noexcept;
    AdmissionTicket(const AdmissionTicket&) = delete;
    AdmissionTicket& operator=(const AdmissionTicket&) = delete;

    /// Report success and release the slot.
    void succeed();

    /// Report failure (optionally with the upstream status) and release the slot.
    void fail(std::optional<int> statusCode = std::nullopt);

    /// True until an outcome has been reported.
    [[nodiscard]] bool pending() const noexcept { return governor_ != nullptr; }

    [[nodiscard]] std::string_view source() const noexcept { return source_; }

private:
    friend class SourceGovernor;

    AdmissionTicket(SourceGovernor& governor, std::string_view source);

    /// Report a failure for an unreported admission and log a warning.
    void abandon() noexcept;

    SourceGovernor* governor_;
    std::string source_;
};

/// Run one governed call and fold every failure into @p fallback.
///
/// Admits against @p source, invokes @p call, and reports the outcome.
/// @p call returns GovernorResult<T>; a failed result may carry the
/// upstream HTTP status as `int` context, which selects throttling backoff.
/// Returns @p fallback if the breaker is open or the call failed.
///
/// Example:
/// @code
///   double score = callOrFallback(governor, "helius", [&] {
///       return fetchHolderConcentration(mint);
///   }, 0.5);
/// @endcode
template <typename T, typename Call>
T callOrFallback(SourceGovernor& governor, std::string_view source, Call&& call,
                 T fallback) {
    static_assert(std::is_same_v<std::invoke_result_t<Call&>, foundation::GovernorResult<T>>,
                  "call must return GovernorResult<T>");

    auto ticket = governor.admit(source);
    if (!ticket) {
        return fallback;
    }

    foundation::GovernorResult<T> result = call();
    if (result.hasValue()) {
        ticket.value().succeed();
        return std::move(result).value();
    }

    const int* status = result.error().template context<int>();
    ticket.value().fail(status != nullptr ? std::optional<int>(*status) : std::nullopt);
    return fallback;
}

} // namespace sgov::governor
