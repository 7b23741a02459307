#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/collector_errors.hpp"
#include "protocol/step_outcome.hpp"
#include "session/summary_writer.hpp"
#include "test_support.hpp"

namespace {

using diagcollect::core::errors::get_error;
using diagcollect::core::errors::get_value;
using diagcollect::core::errors::is_error;
using diagcollect::protocol::StepKind;
using diagcollect::protocol::StepOutcome;
using diagcollect::protocol::StepStatus;
using diagcollect::session::RunSummary;
using diagcollect::session::SummaryWriter;
using diagcollect::testing::local_time;
using diagcollect::testing::read_text;
using diagcollect::testing::TempWorkspace;
using nlohmann::json;

RunSummary sample_summary(const std::filesystem::path& root) {
    StepOutcome ok;
    ok.name = "System log";
    ok.kind = StepKind::ChannelExport;
    ok.status = StepStatus::Success;
    ok.source = "System";
    ok.output_path = root / "System.evtx";
    ok.exit_code = 0;
    ok.exists = true;
    ok.size_ok = true;

    StepOutcome failed;
    failed.name = "TPM log";
    failed.kind = StepKind::ChannelExport;
    failed.status = StepStatus::Failed;
    failed.reason = "no channel succeeded";
    failed.attempted = {"A", "B"};

    StepOutcome skipped;
    skipped.name = "TPM state";
    skipped.status = StepStatus::Skipped;
    skipped.reason = "disabled by configuration";

    StepOutcome report;
    report.name = "MDM XML parsing";
    report.kind = StepKind::ReportExtraction;
    report.status = StepStatus::Success;
    report.item_count = 3;

    return RunSummary{"BitLocker", root, local_time(2024, 5, 6, 7, 8, 9),
                      {ok, failed, skipped, report}};
}

TEST(SummaryWriterTest, JsonCarriesCountsAndStepsInOrder) {
    const auto summary = sample_summary("/var/out/BitLockerLogs-06-05-2024-07-08");
    const auto document = json::parse(SummaryWriter::to_json_text(summary));

    EXPECT_EQ(document["family"], "BitLocker");
    EXPECT_EQ(document["output_root"], "/var/out/BitLockerLogs-06-05-2024-07-08");
    EXPECT_EQ(document["started_at"], "2024-05-06T07:08:09");
    EXPECT_EQ(document["counts"]["total"], 4);
    EXPECT_EQ(document["counts"]["succeeded"], 2);
    EXPECT_EQ(document["counts"]["failed"], 1);
    EXPECT_EQ(document["counts"]["skipped"], 1);

    const auto& steps = document["steps"];
    ASSERT_EQ(steps.size(), 4u);
    EXPECT_EQ(steps[0]["name"], "System log");
    EXPECT_EQ(steps[0]["kind"], "channel_export");
    EXPECT_EQ(steps[0]["status"], "success");
    EXPECT_EQ(steps[0]["source"], "System");
    EXPECT_TRUE(steps[0]["reason"].is_null());
    EXPECT_EQ(steps[1]["reason"], "no channel succeeded");
    EXPECT_EQ(steps[1]["attempted"], json::array({"A", "B"}));
    EXPECT_TRUE(steps[1]["exit_code"].is_null());
    EXPECT_EQ(steps[2]["status"], "skipped");
    EXPECT_FALSE(steps[2].contains("count"));
    EXPECT_EQ(steps[3]["count"], 3);
}

TEST(SummaryWriterTest, WriteCreatesFileInOutputRoot) {
    TempWorkspace workspace("summary");
    const SummaryWriter writer(workspace.root());

    auto written = writer.write(sample_summary(workspace.root()));
    ASSERT_FALSE(is_error(written)) << get_error(written).message;
    EXPECT_EQ(get_value(written), workspace.root() / "collection_summary.json");

    const auto document = json::parse(read_text(get_value(written)));
    EXPECT_EQ(document["counts"]["total"], 4);
}

TEST(SummaryWriterTest, RewriteReplacesPreviousContent) {
    TempWorkspace workspace("summary");
    const SummaryWriter writer(workspace.root());
    auto summary = sample_summary(workspace.root());
    ASSERT_FALSE(is_error(writer.write(summary)));

    summary.steps.resize(1);
    auto written = writer.write(summary);
    ASSERT_FALSE(is_error(written));
    const auto document = json::parse(read_text(get_value(written)));
    EXPECT_EQ(document["counts"]["total"], 1);
}

TEST(SummaryWriterTest, MissingOutputRootIsError) {
    TempWorkspace workspace("summary");
    const SummaryWriter writer(workspace.root() / "gone");
    auto written = writer.write(sample_summary(workspace.root()));
    ASSERT_TRUE(is_error(written));
    EXPECT_EQ(get_error(written).code, "invalid_output_root");
}

TEST(SummaryWriterTest, InvalidUtf8InStepTextIsReplacedNotThrown) {
    TempWorkspace workspace("summary");
    const SummaryWriter writer(workspace.root());
    auto summary = sample_summary(workspace.root());
    summary.steps[1].error = std::string("access denied ") + static_cast<char>(0xFF);

    std::string text;
    EXPECT_NO_THROW(text = SummaryWriter::to_json_text(summary));
    EXPECT_NE(text.find("access denied \xEF\xBF\xBD"), std::string::npos);

    auto written = writer.write(summary);
    ASSERT_FALSE(is_error(written)) << get_error(written).message;
    const auto document = json::parse(read_text(get_value(written)));
    EXPECT_EQ(document["steps"][1]["error"], "access denied \xEF\xBF\xBD");
}

}  // namespace
