#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/collector_errors.hpp"
#include "core/logging/activity_log.hpp"
#include "protocol/step_outcome.hpp"
#include "runtime/step_runner.hpp"
#include "test_support.hpp"

namespace {

using diagcollect::core::errors::CollectorError;
using diagcollect::core::errors::ErrorCategory;
using diagcollect::core::errors::is_error;
using diagcollect::core::errors::Result;
using diagcollect::core::logging::ActivityLog;
using diagcollect::protocol::ExportAttempt;
using diagcollect::protocol::StepKind;
using diagcollect::protocol::StepSpec;
using diagcollect::protocol::StepStatus;
using diagcollect::runtime::StepRunner;
using diagcollect::testing::step_markers;
using diagcollect::testing::TempWorkspace;
using diagcollect::testing::write_bytes;

class StepRunnerTest : public ::testing::Test {
protected:
    StepRunnerTest() : workspace_("step_runner"), log_(workspace_.root() / "activity.log") {}

    void SetUp() override { ASSERT_FALSE(is_error(log_.open())); }

    std::filesystem::path path(const std::string& name) const { return workspace_.root() / name; }

    ExportAttempt attempt_for(const std::string& source, const std::filesystem::path& output,
                              int exit_code = 0) const {
        ExportAttempt attempt;
        attempt.source = source;
        attempt.output_path = output;
        attempt.exit_code = exit_code;
        return attempt;
    }

    TempWorkspace workspace_;
    ActivityLog log_;
};

TEST_F(StepRunnerTest, SuccessfulExportLogsSucceededMarker) {
    const auto out = path("System.evtx");
    StepRunner runner(log_);
    const auto outcome = runner.run({"System log", StepKind::ChannelExport, out}, [&]() {
        write_bytes(out, 2000);
        return Result<ExportAttempt>(attempt_for("System", out));
    });

    EXPECT_EQ(outcome.status, StepStatus::Success);
    EXPECT_FALSE(outcome.reason.has_value());
    EXPECT_TRUE(outcome.exists);
    EXPECT_TRUE(outcome.size_ok);

    const auto markers = step_markers(log_.path());
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_EQ(markers[0], "STEP: System log export succeeded; channel='System'; output='" +
                              out.string() + "'");
}

TEST_F(StepRunnerTest, NonZeroExitIsExportFailed) {
    const auto out = path("FVE.reg");
    StepRunner runner(log_);
    const auto outcome = runner.run({"FVE policy registry", StepKind::RegistryExport, out}, [&]() {
        return Result<ExportAttempt>(attempt_for("HKLM\\X", out, 3));
    });

    EXPECT_EQ(outcome.status, StepStatus::Failed);
    EXPECT_EQ(outcome.reason.value(), "export failed");
    const auto markers = step_markers(log_.path());
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_EQ(markers[0], "STEP: FVE policy registry export failed; reason='export failed'; "
                          "exit=3; exists=false; sizeOK=false; file='" +
                              out.string() + "'");
}

TEST_F(StepRunnerTest, UndersizedArtifactIsEmptyOrMissing) {
    const auto out = path("System.evtx");
    StepRunner runner(log_);
    const auto outcome = runner.run({"System log", StepKind::ChannelExport, out}, [&]() {
        write_bytes(out, 0);
        return Result<ExportAttempt>(attempt_for("System", out));
    });

    EXPECT_EQ(outcome.status, StepStatus::Failed);
    EXPECT_EQ(outcome.reason.value(), "empty or missing file");
    EXPECT_TRUE(outcome.exists);
    EXPECT_FALSE(outcome.size_ok);
    const auto markers = step_markers(log_.path());
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_NE(markers[0].find("reason='empty or missing file'; exit=0; exists=true; sizeOK=false"),
              std::string::npos);
}

TEST_F(StepRunnerTest, ThrowingActionBecomesExceptionOutcome) {
    const auto out = path("status.txt");
    StepRunner runner(log_);
    const auto outcome = runner.run({"BitLocker status", StepKind::FileQuery, out},
                                    []() -> Result<ExportAttempt> {
                                        throw std::runtime_error("tool vanished");
                                    });

    EXPECT_EQ(outcome.status, StepStatus::Failed);
    EXPECT_EQ(outcome.reason.value(), "exception");
    EXPECT_EQ(outcome.error.value(), "tool vanished");
    const auto markers = step_markers(log_.path());
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_EQ(markers[0], "STEP: BitLocker status export failed; reason='exception'; file='" +
                              out.string() + "'; error='tool vanished'");
}

TEST_F(StepRunnerTest, NonStandardThrowIsStillContained) {
    StepRunner runner(log_);
    const auto outcome = runner.run({"odd", StepKind::FileQuery, path("odd.txt")},
                                    []() -> Result<ExportAttempt> { throw 42; });
    EXPECT_EQ(outcome.status, StepStatus::Failed);
    EXPECT_EQ(outcome.reason.value(), "exception");
    EXPECT_EQ(outcome.error.value(), "unknown exception");
}

TEST_F(StepRunnerTest, ErrorValueMapsToReason) {
    StepRunner runner(log_);
    const auto missing = runner.run({"FVE policy registry", StepKind::RegistryExport, path("a.reg")},
                                    []() -> Result<ExportAttempt> {
                                        return CollectorError{ErrorCategory::Execution,
                                                              "Registry key not found: X",
                                                              "source_not_found"};
                                    });
    EXPECT_EQ(missing.reason.value(), "source not found");
    EXPECT_EQ(missing.error.value(), "Registry key not found: X");
    EXPECT_FALSE(missing.exit_code.has_value());

    const auto broken = runner.run({"TPM state", StepKind::FileQuery, path("tpm.txt")},
                                   []() -> Result<ExportAttempt> {
                                       return CollectorError{ErrorCategory::Internal,
                                                             "fork failed", "fork_failed"};
                                   });
    EXPECT_EQ(broken.reason.value(), "export failed");

    const auto markers = step_markers(log_.path());
    ASSERT_EQ(markers.size(), 2u);
    EXPECT_NE(markers[0].find("reason='source not found'; exit=-1;"), std::string::npos);
}

TEST_F(StepRunnerTest, ActionReportedReasonWins) {
    const auto out = path("MDM.xml");
    StepRunner runner(log_);
    const auto outcome = runner.run({"MDM XML parsing", StepKind::ReportExtraction, out}, [&]() {
        auto attempt = attempt_for("BitLocker", out);
        attempt.failure_reason = "no matching nodes";
        attempt.item_count = 0;
        return Result<ExportAttempt>(attempt);
    });
    EXPECT_EQ(outcome.status, StepStatus::Failed);
    EXPECT_EQ(outcome.reason.value(), "no matching nodes");

    const auto markers = step_markers(log_.path());
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_EQ(markers[0], "STEP: MDM XML parsing failed; reason='no matching nodes'; file='" +
                              out.string() + "'");
}

TEST_F(StepRunnerTest, ReportSuccessCarriesCount) {
    const auto out = path("MDM.xml");
    StepRunner runner(log_);
    const auto outcome = runner.run({"MDM XML parsing", StepKind::ReportExtraction, out}, [&]() {
        diagcollect::testing::write_file(out, "<Root/>");
        auto attempt = attempt_for("BitLocker", out);
        attempt.item_count = 2;
        return Result<ExportAttempt>(attempt);
    });
    EXPECT_EQ(outcome.status, StepStatus::Success);
    const auto markers = step_markers(log_.path());
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_EQ(markers[0],
              "STEP: MDM XML parsing succeeded; output='" + out.string() + "'; count=2");
}

TEST_F(StepRunnerTest, ArchiveFailureUsesZipMarker) {
    const auto out = path("Logs.zip");
    StepRunner runner(log_);
    const auto outcome = runner.run({"ZIP archive", StepKind::Archive, out}, [&]() {
        return Result<ExportAttempt>(attempt_for("Logs", out, 12));
    });
    EXPECT_EQ(outcome.reason.value(), "archive failed");
    const auto markers = step_markers(log_.path());
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_EQ(markers[0],
              "STEP: ZIP archive failed; reason='archive failed'; file='" + out.string() + "'");
}

TEST_F(StepRunnerTest, SkipLogsSkippedMarker) {
    StepRunner runner(log_);
    const auto outcome =
        runner.skip({"TPM log", StepKind::ChannelExport, path("TPM.evtx")}, "disabled by configuration");
    EXPECT_EQ(outcome.status, StepStatus::Skipped);
    const auto markers = step_markers(log_.path());
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_EQ(markers[0].rfind("STEP: TPM log export skipped; reason='disabled by configuration'", 0),
              0u);
}

TEST_F(StepRunnerTest, FailingMiddleStepDoesNotStopLaterSteps) {
    StepRunner runner(log_);
    std::vector<int> executed;

    std::vector<diagcollect::protocol::StepOutcome> outcomes;
    for (int i = 1; i <= 5; ++i) {
        const auto out = path("step" + std::to_string(i) + ".txt");
        const StepSpec spec{"Step " + std::to_string(i), StepKind::FileQuery, out};
        outcomes.push_back(runner.run(spec, [&, i, out]() -> Result<ExportAttempt> {
            executed.push_back(i);
            if (i == 2) {
                throw std::runtime_error("step two exploded");
            }
            diagcollect::testing::write_file(out, "data");
            return attempt_for("query", out);
        }));
    }

    EXPECT_EQ(executed, (std::vector<int>{1, 2, 3, 4, 5}));
    ASSERT_EQ(outcomes.size(), 5u);
    EXPECT_EQ(outcomes[1].reason.value(), "exception");
    EXPECT_EQ(outcomes[0].status, StepStatus::Success);
    EXPECT_EQ(outcomes[2].status, StepStatus::Success);
    EXPECT_EQ(outcomes[4].status, StepStatus::Success);
    EXPECT_EQ(step_markers(log_.path()).size(), 5u);
}

TEST_F(StepRunnerTest, MultiLineErrorStaysOnOneMarkerLine) {
    const auto out = path("status.txt");
    StepRunner runner(log_);
    runner.run({"BitLocker status", StepKind::FileQuery, out}, []() -> Result<ExportAttempt> {
        throw std::runtime_error(
            "access denied\nSTEP: fake export succeeded; channel='x'; output='y'");
    });

    const auto lines = diagcollect::testing::read_lines(log_.path());
    ASSERT_EQ(lines.size(), 2u);  // "Starting step" and the marker
    const auto markers = step_markers(log_.path());
    ASSERT_EQ(markers.size(), 1u);
    EXPECT_EQ(markers[0], "STEP: BitLocker status export failed; reason='exception'; file='" +
                              out.string() +
                              "'; error='access denied\\nSTEP: fake export succeeded; "
                              "channel=\\'x\\'; output=\\'y\\''");
}

}  // namespace
