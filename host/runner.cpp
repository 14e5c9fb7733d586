#include "runner.hpp"
#include <common/logging.hpp>
#include <string>

namespace envelopekit::host {

namespace {

void append_causes(std::vector<std::string>& lines, const std::exception& e, int depth) {
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& cause) {
        lines.push_back(std::string(static_cast<size_t>(depth) * 2, ' ') +
                        "caused by: " + summarize_error(cause));
        append_causes(lines, cause, depth + 1);
    }
}

}  // namespace

std::string summarize_error(const std::exception& e) {
    if (const auto* error = dynamic_cast<const Error*>(&e)) {
        return std::string(error_kind_name(error->kind())) + ": " + e.what();
    }
    return std::string("Error: ") + e.what();
}

std::vector<std::string> error_trace(const std::exception& e) {
    std::vector<std::string> lines;
    if (const auto* error = dynamic_cast<const Error*>(&e)) {
        lines.push_back(std::string("kind: ") + error_kind_name(error->kind()));
    } else {
        lines.push_back("kind: unclassified");
    }
    if (const auto* geom = dynamic_cast<const GeometryConstructionError*>(&e)) {
        lines.push_back("element: " + geom->element());
    }
    lines.push_back(std::string("message: ") + e.what());
    append_causes(lines, e, 1);
    return lines;
}

GeometryConstructionError from_kernel_failure(const Standard_Failure& e) {
    const char* message = e.GetMessageString();
    std::string type = e.DynamicType()->Name();
    return GeometryConstructionError(
        "Geometry kernel failure: " + std::string(message && *message ? message : type), type);
}

void record_failure(std::vector<std::string>& diagnostics, const std::exception& e, bool debug) {
    auto log = envelopekit::logging::get_logger();

    diagnostics.push_back(summarize_error(e));
    log->debug("run: {}", diagnostics.back());

    if (debug) {
        for (auto& line : error_trace(e)) {
            diagnostics.push_back(std::move(line));
        }
    }
}

}  // namespace envelopekit::host
