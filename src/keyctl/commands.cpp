// Copyright 2025 NeutronKey Project
// SPDX-License-Identifier: Apache-2.0

#include "commands.h"

#include <cstdlib>
#include <stdexcept>

#include "neutron/identifier.h"
#include "neutron/status_translator.h"

namespace neutron::keyctl {

LoggingOptions ResolveLoggingOptions(std::string_view level_flag) {
    if (level_flag.empty()) {
        return LoggingOptions::FromEnvironment();
    }

    LoggingOptions options;
    options.level = ParseLogLevel(level_flag);
    const char* pattern_env = std::getenv("NEUTRON_LOG_PATTERN");
    if (pattern_env && pattern_env[0] != '\0') {
        options.pattern = pattern_env;
    }
    return options;
}

int RunConvert(const std::vector<std::string>& args, std::ostream& out) {
    bool all_ok = true;
    for (const auto& id : args) {
        auto key = ConvertIdentifierToKey(id);
        out << id << '\t' << (key ? *key : "-") << '\n';
        all_ok = all_ok && key.has_value();
    }
    return all_ok ? kExitOk : kExitFailed;
}

int RunValidate(const std::vector<std::string>& args, std::ostream& out) {
    bool all_ok = true;
    for (const auto& id : args) {
        const bool valid = IsValidIdentifier(id);
        out << id << '\t' << (valid ? "valid" : "invalid") << '\n';
        all_ok = all_ok && valid;
    }
    return all_ok ? kExitOk : kExitFailed;
}

int RunClassify(const std::vector<std::string>& args, std::ostream& out) {
    bool all_ok = true;
    for (const auto& id : args) {
        const auto shape = ClassifyIdentifier(id);
        out << id << '\t' << IdentifierShapeName(shape) << '\n';
        all_ok = all_ok && shape != IdentifierShape::kInvalid;
    }
    return all_ok ? kExitOk : kExitFailed;
}

int RunStatus(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    bool all_ok = true;
    for (const auto& name : args) {
        auto code = ParseStatusCode(name);
        if (!code) {
            err << "Unknown status code: " << name << '\n';
            all_ok = false;
            continue;
        }
        const Status status(*code, "from command line");
        if (status.IsSuccess()) {
            err << "Not a failure status: " << name << '\n';
            all_ok = false;
            continue;
        }
        out << name << '\t' << TranslateFailureStatus(status) << '\n';
    }
    return all_ok ? kExitOk : kExitFailed;
}

int Run(const Invocation& invocation, std::ostream& out, std::ostream& err) {
    try {
        InitLogging(ResolveLoggingOptions(invocation.log_level));
    } catch (const std::invalid_argument& e) {
        err << e.what() << '\n';
        return kExitUsage;
    }

    if (invocation.args.empty()) {
        err << kUsage << '\n';
        return kExitUsage;
    }

    const auto& mode = invocation.mode;
    if (mode == "convert") {
        return RunConvert(invocation.args, out);
    }
    if (mode == "validate") {
        return RunValidate(invocation.args, out);
    }
    if (mode == "classify") {
        return RunClassify(invocation.args, out);
    }
    if (mode == "status") {
        return RunStatus(invocation.args, out, err);
    }
    err << "Unknown mode: " << mode << '\n';
    return kExitUsage;
}

}  // namespace neutron::keyctl
