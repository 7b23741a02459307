#pragma once
#include "tools/collaborators.hpp"

namespace diagcollect::app {

    constexpr int kExitSuccess = 0;
    constexpr int kExitFault = 1;
    constexpr int kExitInsufficientPrivilege = 2;

    // Full command-line flow. `privilege` is consulted right after parsing,
    // before the config file or any output location is touched.
    int run_collector(int argc, char* argv[], const tools::PrivilegeChecker& privilege);

}  // namespace diagcollect::app
