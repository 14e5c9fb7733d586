#ifndef ENVELOPEKIT_HOST_RUNNER_HPP
#define ENVELOPEKIT_HOST_RUNNER_HPP

#include <common/errors.hpp>
#include <Standard_Failure.hxx>
#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace envelopekit::host {

// Outcome of a generator call made from a host: either a value, or no value
// plus diagnostics describing the failure.
template <typename T>
struct RunResult {
    std::optional<T> value;
    std::vector<std::string> diagnostics;
    std::optional<ErrorKind> error_kind;   // unset for non-envelopekit failures

    bool ok() const { return value.has_value(); }
};

// One line: "<Kind>: <message>"
std::string summarize_error(const std::exception& e);

// Detailed lines for debug mode: kind, failing element, nested causes
std::vector<std::string> error_trace(const std::exception& e);

// Geometry kernel exception as a construction error; the element is the
// kernel's exception type
GeometryConstructionError from_kernel_failure(const Standard_Failure& e);

// Logs the failure and fills diagnostics
void record_failure(std::vector<std::string>& diagnostics, const std::exception& e, bool debug);

// Invokes `fn` and converts any error into diagnostics, so nothing
// propagates to the host environment.
template <typename Fn>
RunResult<std::invoke_result_t<Fn>> run(Fn&& fn, bool debug = false) {
    RunResult<std::invoke_result_t<Fn>> result;
    try {
        result.value.emplace(std::forward<Fn>(fn)());
    } catch (const Error& e) {
        result.error_kind = e.kind();
        record_failure(result.diagnostics, e, debug);
    } catch (const std::exception& e) {
        record_failure(result.diagnostics, e, debug);
    } catch (const Standard_Failure& e) {
        GeometryConstructionError error = from_kernel_failure(e);
        result.error_kind = error.kind();
        record_failure(result.diagnostics, error, debug);
    }
    return result;
}

}  // namespace envelopekit::host

#endif // ENVELOPEKIT_HOST_RUNNER_HPP
