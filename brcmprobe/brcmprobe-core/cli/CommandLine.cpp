//
//  CommandLine.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "CommandLine.hpp"
#include <brcmprobe-core/config/ProbeConfig.hpp>
#include <brcmprobe-core/util/StringUtils.h>

using namespace std;
using namespace brcmprobe;

CommandLine::CommandLine(string bin, string desc, vector<OptionSpec> options):
    helpRequested(false),
    bin(bin),
    options(options),
    parser(bin, desc)
{
    for (const OptionSpec &option : this->options) {
        if (option.names.back() == "--help") {
            continue;
        }
        parser.add_argument()
        .names(option.names)
        .description(option.description);
    }
    parser.enable_help();
}

const OptionSpec* CommandLine::optionForToken(const string &token) {
    for (const OptionSpec &option : options) {
        for (const string &name : option.names) {
            if (name == token) {
                return &option;
            }
        }
    }
    return nullptr;
}

bp_return_t CommandLine::prescan(int argc, const char *argv[], string &errorOut) {
    for (int i = 1; i < argc; i++) {
        string token = argv[i];
        const OptionSpec *option = optionForToken(token);
        if (!option) {
            errorOut = "Unknown option: " + token;
            return BP_UNKNOWN_OPTION;
        }
        if (!option->takesValue) {
            continue;
        }
        if (i + 1 >= argc) {
            errorOut = "Missing value for " + token;
            return BP_INVALID_ARGUMENTS;
        }
        i++;
    }
    return BP_SUCCESS;
}

string CommandLine::valueOf(const string &name) {
    if (!parser.exists(name)) {
        return "";
    }
    return parser.get<string>(name);
}

bp_return_t CommandLine::parseCommon(int argc, const char *argv[], string &errorOut) {
    bp_return_t ret = prescan(argc, argv, errorOut);
    if (ret != BP_SUCCESS) {
        return ret;
    }
    
    auto err = parser.parse(argc, argv);
    if (err) {
        errorOut = err.what();
        return BP_INVALID_ARGUMENTS;
    }
    
    if (parser.exists("help")) {
        helpRequested = true;
        return BP_SUCCESS;
    }
    
    reportPath = valueOf("report");
    if (parser.exists("data")) {
        ret = ProbeConfig::parseExtraData(valueOf("data"), extraData, errorOut);
        if (ret != BP_SUCCESS) {
            return ret;
        }
    }
    return BP_SUCCESS;
}

void CommandLine::printUsage() {
    parser.print_help();
}
