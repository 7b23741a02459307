#include "runtime/collection_plan.hpp"

#include <utility>

namespace diagcollect::runtime {

using protocol::ArtifactFamily;
using protocol::StepKind;

namespace {

PlannedStep query_step(std::string name, std::string file, std::string command) {
    return PlannedStep{{std::move(name), StepKind::FileQuery, std::move(file)},
                       {std::move(command)}};
}

PlannedStep channel_step(std::string name, std::string file,
                         std::vector<std::string> candidates) {
    return PlannedStep{{std::move(name), StepKind::ChannelExport, std::move(file)},
                       std::move(candidates)};
}

PlannedStep registry_step(std::string name, std::string file, std::string key) {
    return PlannedStep{{std::move(name), StepKind::RegistryExport, std::move(file)},
                       {std::move(key)}};
}

std::vector<PlannedStep> bitlocker_steps() {
    return {
        query_step("BitLocker status", "BitLockerStatus.txt", "manage-bde.exe -status"),
        query_step("BitLocker key protectors", "BitLockerProtectors.txt",
                   "manage-bde.exe -protectors -get C:"),
        query_step("TPM state", "TpmState.txt",
                   "powershell.exe -NoProfile -NonInteractive -Command "
                   "\"Get-Tpm | Format-List *\""),
        channel_step("BitLocker management log", "BitLocker-Management.evtx",
                     {"Microsoft-Windows-BitLocker/BitLocker Management",
                      "Microsoft-Windows-BitLocker-API/Management"}),
        channel_step("BitLocker drive preparation log", "BitLocker-DrivePreparation.evtx",
                     {"Microsoft-Windows-BitLocker-DrivePreparationTool/Operational",
                      "Microsoft-Windows-BitLocker-DrivePreparationTool/Admin"}),
        channel_step("TPM log", "TPM-WMI.evtx",
                     {"Microsoft-Windows-TPM-WMI", "Microsoft-Windows-TPM-WMI/Operational"}),
        channel_step("System log", "System.evtx", {"System"}),
        registry_step("FVE policy registry", "FVE_Policies.reg",
                      "HKLM\\SOFTWARE\\Policies\\Microsoft\\FVE"),
        registry_step("BitLocker status registry", "BitLockerStatus.reg",
                      "HKLM\\SYSTEM\\CurrentControlSet\\Control\\BitLockerStatus"),
    };
}

std::vector<PlannedStep> defender_steps() {
    return {
        query_step("Defender status", "DefenderStatus.txt",
                   "powershell.exe -NoProfile -NonInteractive -Command "
                   "\"Get-MpComputerStatus | Format-List *\""),
        query_step("Defender preferences", "DefenderPreferences.txt",
                   "powershell.exe -NoProfile -NonInteractive -Command "
                   "\"Get-MpPreference | Format-List *\""),
        channel_step("Defender operational log", "Defender-Operational.evtx",
                     {"Microsoft-Windows-Windows Defender/Operational"}),
        channel_step("Defender WHC log", "Defender-WHC.evtx",
                     {"Microsoft-Windows-Windows Defender/WHC"}),
        registry_step("Defender policy registry", "Defender_Policies.reg",
                      "HKLM\\SOFTWARE\\Policies\\Microsoft\\Windows Defender"),
        registry_step("Defender configuration registry", "Defender_Config.reg",
                      "HKLM\\SOFTWARE\\Microsoft\\Windows Defender"),
    };
}

ReportExtractionPlan bitlocker_report() {
    ReportExtractionPlan plan;
    plan.spec = {kReportStepName, StepKind::ReportExtraction, "MDM_BitLocker_Policies.xml"};
    plan.query.node_path =
        "/MDMEnterpriseDiagnosticsReport/PolicyManager/ConfigSource/PolicyScope/Area";
    plan.query.selector_field = "PolicyAreaName";
    plan.query.selector_value = "BitLocker";
    plan.query.output_root = "BitLockerMDMPolicies";
    return plan;
}

}  // namespace

CollectionPlan build_plan(const ArtifactFamily family, const bool include_report,
                          const core::config::CollectorConfig& config) {
    CollectionPlan plan;
    plan.family = family;

    switch (family) {
        case ArtifactFamily::BitLocker:
            plan.steps = bitlocker_steps();
            if (include_report) {
                plan.report = bitlocker_report();
            }
            break;
        case ArtifactFamily::Defender:
            plan.steps = defender_steps();
            break;
    }

    for (auto& step : plan.steps) {
        step.enabled = config.disabled_steps.count(step.spec.name) == 0;
        if (step.spec.kind != StepKind::FileQuery) {
            continue;
        }
        const auto override_it = config.commands.queries.find(step.spec.name);
        if (override_it != config.commands.queries.end()) {
            step.sources = {override_it->second};
        }
    }
    return plan;
}

}  // namespace diagcollect::runtime
