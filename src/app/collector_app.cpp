#include "app/collector_app.hpp"

#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/collector_config.hpp"
#include "core/errors/collector_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/collection_plan.hpp"
#include "session/collection_run.hpp"
#include "session/run_directory.hpp"
#include "tools/shell_collaborators.hpp"

namespace diagcollect::app {

namespace {

void report_error(const std::string& context, const core::errors::CollectorError& err) {
    LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int run_collector(int argc, char* argv[], const tools::PrivilegeChecker& privilege) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = cli::parse_and_validate(argc, argv);
    if (core::errors::is_error(parsed)) {
        report_error("Input error", core::errors::get_error(parsed));
        return kExitFault;
    }
    const auto& command = core::errors::get_value(parsed);
    if (command.show_help) {
        std::cout << cli::usage() << std::endl;
        return kExitSuccess;
    }
    const auto& req = command.request;
    core::logging::Logger::get().set_verbose(req.verbose);

    // 2. Privileges are checked before anything touches the disk
    if (!privilege.is_elevated()) {
        LOG_ERROR("Collection requires elevated privileges.");
        LOG_INFO("Hint: re-run from an elevated (administrator/root) shell.");
        return kExitInsufficientPrivilege;
    }

    // 3. Configuration and collaborators
    core::config::CollectorConfig config;
    if (req.config_file.has_value()) {
        auto loaded = core::config::load_config(req.config_file.value());
        if (core::errors::is_error(loaded)) {
            report_error("Configuration error", core::errors::get_error(loaded));
            return kExitFault;
        }
        config = core::errors::get_value(loaded);
    }
    auto collaborators = tools::make_shell_collaborators(config);

    auto base = session::resolve_base_path(req);
    if (core::errors::is_error(base)) {
        report_error("Unable to resolve output location", core::errors::get_error(base));
        return kExitFault;
    }

    // 4. Initializing: the only phase allowed to abort the run
    session::CollectionRun run(core::errors::get_value(base), req.family, collaborators);
    auto initialized = run.initialize();
    if (core::errors::is_error(initialized)) {
        const auto& err = core::errors::get_error(initialized);
        report_error("Failed to start collection", err);
        return err.code == "insufficient_privilege" ? kExitInsufficientPrivilege : kExitFault;
    }

    // 5. Steps, optional archive, final summary
    const auto plan = runtime::build_plan(req.family, req.include_mdm, config);
    auto completed = run.execute(plan, req.archive);
    if (core::errors::is_error(completed)) {
        report_error("Collection aborted", core::errors::get_error(completed));
        return kExitFault;
    }
    return kExitSuccess;
}

}  // namespace diagcollect::app
