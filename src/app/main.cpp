#include <exception>
#include <string>
#include "app/collector_app.hpp"
#include "core/logging/logger.hpp"
#include "tools/shell_collaborators.hpp"

int main(int argc, char* argv[]) {
    try {
        const diagcollect::tools::PosixPrivilegeChecker privilege{};
        return diagcollect::app::run_collector(argc, argv, privilege);
    } catch (const std::exception& ex) {
        LOG_ERROR(std::string("Unhandled fault: ") + ex.what());
        return diagcollect::app::kExitFault;
    }
}
