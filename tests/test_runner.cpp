#include <gtest/gtest.h>
#include <host/runner.hpp>
#include <common/logging.hpp>
#include <panels/grid_panelizer.hpp>
#include <tower/tower_twister.hpp>
#include "test_helpers.hpp"
#include <Standard_ConstructionError.hxx>
#include <algorithm>
#include <stdexcept>

using namespace envelopekit;

namespace {

bool contains_line(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

}  // namespace

TEST(RunnerTest, SuccessCarriesValue) {
    auto result = host::run([] { return generate_panel_ids(2, 2); });
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value->size(), 4u);
    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_FALSE(result.error_kind.has_value());
}

TEST(RunnerTest, ValidationErrorBecomesDiagnostic) {
    auto result = host::run([] { return generate_panel_ids(0, 2); });
    EXPECT_FALSE(result.ok());
    ASSERT_TRUE(result.error_kind.has_value());
    EXPECT_EQ(*result.error_kind, ErrorKind::InputValidation);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].rfind("InputValidationError: ", 0), 0u);
}

TEST(RunnerTest, UnsupportedInputKind) {
    auto result = host::run([] {
        return panelize(envelopekit::test::unit_square(), 2, 2);
    });
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_kind, ErrorKind::UnsupportedInput);
}

TEST(RunnerTest, DebugAddsElementTag) {
    // Every corner on the x axis: the single cell cannot become a panel
    SurfacePtr line = Surface::bilinear({0, 0, 0}, {1, 0, 0}, {3, 0, 0}, {2, 0, 0});
    auto result = host::run([&] { return panelize(line, 1, 1); }, true);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_kind, ErrorKind::GeometryConstruction);
    EXPECT_GT(result.diagnostics.size(), 1u);
    EXPECT_TRUE(contains_line(result.diagnostics, "element: (1, 1)"));
    EXPECT_TRUE(contains_line(result.diagnostics, "kind: GeometryConstructionError"));
}

TEST(RunnerTest, NonDebugKeepsMessageShort) {
    Vec3 p(0.0, 0.0, 0.0);
    Curve collapsed({p, p, p}, true);
    auto result = host::run([&] { return twist_tower(collapsed, 2, 3.0, 0); });
    EXPECT_EQ(result.error_kind, ErrorKind::InputValidation);
    EXPECT_EQ(result.diagnostics.size(), 1u);
}

TEST(RunnerTest, KernelExceptionBecomesConstructionError) {
    auto result = host::run([]() -> int { throw Standard_ConstructionError("null direction"); }, true);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_kind, ErrorKind::GeometryConstruction);
    ASSERT_FALSE(result.diagnostics.empty());
    EXPECT_EQ(result.diagnostics[0], "GeometryConstructionError: Geometry kernel failure: null direction");
    EXPECT_TRUE(contains_line(result.diagnostics, "element: Standard_ConstructionError"));
}

TEST(RunnerTest, ForeignExceptionIsContained) {
    auto result = host::run([]() -> int { throw std::out_of_range("index 7"); });
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.error_kind.has_value());
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0], "Error: index 7");
}

TEST(RunnerTest, NestedCausesInDebugTrace) {
    auto result = host::run([]() -> int {
        try {
            throw std::runtime_error("corner not finite");
        } catch (const std::exception&) {
            std::throw_with_nested(GeometryConstructionError("Failed to create panel", "(1, 1)"));
        }
    }, true);

    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(contains_line(result.diagnostics, "caused by: Error: corner not finite"));
}

TEST(RunnerTest, SummarizeError) {
    EXPECT_EQ(host::summarize_error(UnsupportedInputError("curve")), "UnsupportedInputError: curve");
    EXPECT_EQ(host::summarize_error(std::logic_error("bad")), "Error: bad");
}

TEST(LoggingTest, LevelNames) {
    EXPECT_EQ(logging::level_from_name("warn"), spdlog::level::warn);
    EXPECT_EQ(logging::level_from_name("error"), spdlog::level::err);
    EXPECT_FALSE(logging::level_from_name("loud").has_value());
}

TEST(LoggingTest, VerboseRaisesToDebug) {
    auto log = logging::get_logger();
    auto saved = log->level();
    log->set_level(spdlog::level::info);

    logging::set_verbose(true);
    EXPECT_EQ(log->level(), spdlog::level::debug);

    log->set_level(spdlog::level::trace);
    logging::set_verbose(true);
    EXPECT_EQ(log->level(), spdlog::level::trace);

    log->set_level(saved);
}
