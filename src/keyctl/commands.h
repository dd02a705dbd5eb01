// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#ifndef NEUTRONKEY_KEYCTL_COMMANDS_H
#define NEUTRONKEY_KEYCTL_COMMANDS_H

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "neutron/logging.h"

namespace neutron::keyctl {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailed = 1;
inline constexpr int kExitUsage = 2;

inline constexpr char kUsage[] =
    "Validate neutron identifiers and convert them to store keys.\n"
    "Usage: neutron_keyctl [--mode=convert|validate|classify|status] ARGS...";

struct Invocation {
    std::string mode{"convert"};
    std::string log_level;          // empty: NEUTRON_LOG_LEVEL decides
    std::vector<std::string> args;  // positional arguments, program name excluded
};

// Logging options from the environment with a non-empty level_flag
// taking precedence over NEUTRON_LOG_LEVEL.
// Throws std::invalid_argument for an unknown level name.
LoggingOptions ResolveLoggingOptions(std::string_view level_flag);

// Each writes one line per argument to out and returns kExitOk when
// every argument succeeded, kExitFailed otherwise.
int RunConvert(const std::vector<std::string>& args, std::ostream& out);
int RunValidate(const std::vector<std::string>& args, std::ostream& out);
int RunClassify(const std::vector<std::string>& args, std::ostream& out);
int RunStatus(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

// Configures logging, then dispatches on the mode. Usage errors go to
// err and return kExitUsage.
int Run(const Invocation& invocation, std::ostream& out, std::ostream& err);

}  // namespace neutron::keyctl

#endif //NEUTRONKEY_KEYCTL_COMMANDS_H
