// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

// Command-line front end for the neutron identifier helpers.
//
//   neutron_keyctl --mode=convert 2fac9cb4-0b4f-4b94-9c84-3ef8eaf4b2c5
//   neutron_keyctl --mode=status NOT_FOUND CONFLICT

#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"

#include "keyctl/commands.h"

ABSL_FLAG(std::string, mode, "convert", "One of convert, validate, classify or status");
ABSL_FLAG(std::string, log_level, "", "Log level; overrides NEUTRON_LOG_LEVEL when set");

int main(int argc, char** argv) {
    absl::SetProgramUsageMessage(neutron::keyctl::kUsage);
    std::vector<char*> positional = absl::ParseCommandLine(argc, argv);

    neutron::keyctl::Invocation invocation;
    invocation.mode = absl::GetFlag(FLAGS_mode);
    invocation.log_level = absl::GetFlag(FLAGS_log_level);
    // positional[0] is the program name
    invocation.args.assign(positional.begin() + 1, positional.end());

    return neutron::keyctl::Run(invocation, std::cout, std::cerr);
}
