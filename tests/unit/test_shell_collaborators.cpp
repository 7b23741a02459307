#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/collector_config.hpp"
#include "core/errors/collector_errors.hpp"
#include "tools/shell_collaborators.hpp"
#include "test_support.hpp"

namespace {

using diagcollect::core::config::CollectorConfig;
using diagcollect::core::config::CommandTemplates;
using diagcollect::core::errors::get_error;
using diagcollect::core::errors::get_value;
using diagcollect::core::errors::is_error;
using diagcollect::testing::read_text;
using diagcollect::testing::TempWorkspace;
using diagcollect::tools::expand_template;

TEST(ShellCollaboratorsTest, ExpandTemplateQuotesKnownPlaceholders) {
    EXPECT_EQ(expand_template("wevtutil.exe epl {channel} {output}",
                              {{"channel", "Microsoft-Windows-TPM-WMI"},
                               {"output", "/tmp/out dir/TPM.evtx"}}),
              "wevtutil.exe epl 'Microsoft-Windows-TPM-WMI' '/tmp/out dir/TPM.evtx'");
}

TEST(ShellCollaboratorsTest, ExpandTemplateLeavesUnknownPlaceholders) {
    EXPECT_EQ(expand_template("awk '{print $1}' {file}", {{"file", "a"}}),
              "awk '{print $1}' 'a'");
    EXPECT_EQ(expand_template("dangling {brace", {}), "dangling {brace");
}

TEST(ShellCollaboratorsTest, StateQueryStoresStdout) {
    TempWorkspace workspace("shell");
    diagcollect::tools::ShellStateQuery query;
    const auto out = workspace.root() / "status.txt";

    auto result = query.run_query("printf 'Protection On\\n'; exit 4", out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 4);
    EXPECT_EQ(read_text(out), "Protection On\n");
}

TEST(ShellCollaboratorsTest, StateQueryTimeoutIsError) {
    TempWorkspace workspace("shell");
    diagcollect::tools::ShellStateQuery query(100);

    auto result = query.run_query("exec sleep 5", workspace.root() / "slow.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "command_timed_out");
}

TEST(ShellCollaboratorsTest, EventLogExporterUsesTemplates) {
    TempWorkspace workspace("shell");
    CommandTemplates templates;
    templates.channel_probe = "test {channel} = System";
    templates.channel_export = "printf '%s' {channel} > {output}";
    diagcollect::tools::ShellEventLogExporter exporter(templates);

    EXPECT_TRUE(exporter.channel_exists("System"));
    EXPECT_FALSE(exporter.channel_exists("Microsoft-Windows-TPM-WMI"));

    const auto out = workspace.root() / "System.evtx";
    auto result = exporter.export_channel("System", out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 0);
    EXPECT_EQ(read_text(out), "System");
}

TEST(ShellCollaboratorsTest, RegistryExporterProbeAndExport) {
    TempWorkspace workspace("shell");
    CommandTemplates templates;
    templates.registry_probe = "test {key} = 'HKLM\\SOFTWARE\\X'";
    templates.registry_export = "printf '[%s]' {key} > {output}";
    diagcollect::tools::ShellRegistryExporter registry(templates);

    EXPECT_TRUE(registry.key_exists("HKLM\\SOFTWARE\\X"));
    EXPECT_FALSE(registry.key_exists("HKLM\\SOFTWARE\\Y"));

    const auto out = workspace.root() / "x.reg";
    auto result = registry.export_key("HKLM\\SOFTWARE\\X", out);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(read_text(out), "[HKLM\\SOFTWARE\\X]");
}

TEST(ShellCollaboratorsTest, ReportGeneratorCreatesDirectory) {
    TempWorkspace workspace("shell");
    diagcollect::tools::ShellReportGenerator generator(
        "printf '<Report/>' > {dir}/MDMDiagReport.xml");
    const auto dir = workspace.root() / "MDMDiag";

    auto result = generator.generate(dir);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 0);
    EXPECT_EQ(read_text(dir / "MDMDiagReport.xml"), "<Report/>");
}

TEST(ShellCollaboratorsTest, ArchiveCompressorRunsFromParentDirectory) {
    TempWorkspace workspace("shell");
    const auto source = workspace.root() / "DefenderLogs-01-01-2024-00-00";
    diagcollect::testing::write_file(source / "a.txt", "a");
    diagcollect::tools::ShellArchiveCompressor compressor(
        "test -f {source}/a.txt && printf '%s' {source} > {dest}");
    const auto dest = workspace.root() / "out.zip";

    auto result = compressor.compress(source, dest);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 0);
    EXPECT_EQ(read_text(dest), "DefenderLogs-01-01-2024-00-00");
}

TEST(ShellCollaboratorsTest, FactoryProvidesEveryCollaborator) {
    const auto collaborators = diagcollect::tools::make_shell_collaborators(CollectorConfig{});
    EXPECT_TRUE(collaborators.privilege);
    EXPECT_TRUE(collaborators.query);
    EXPECT_TRUE(collaborators.event_logs);
    EXPECT_TRUE(collaborators.registry);
    EXPECT_TRUE(collaborators.report);
    EXPECT_TRUE(collaborators.archiver);
}

}  // namespace
