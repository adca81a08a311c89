//
//  CommandRunner.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "CommandRunner.hpp"
#include <brcmprobe-core/util/StringUtils.h>
#include <brcmprobe-core/log/buffered_logger.hpp>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>
#include <unistd.h>

using namespace std;
using namespace brcmprobe;

bool CommandRunner::isToolAvailable(const string &tool) {
    if (tool.empty()) {
        return false;
    }
    if (tool.find('/') != string::npos) {
        return access(tool.c_str(), X_OK) == 0;
    }
    
    const char *pathEnv = getenv("PATH");
    if (!pathEnv) {
        return false;
    }
    for (string dir : StringUtils::split(pathEnv, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        string candidate = StringUtils::path_join(dir, tool);
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

int CommandRunner::run(const string &cmd, string &outputOut) {
    BufferedLogger::globalLogger()->append("    [CMD] " + cmd);
    
    string fullCmd = cmd + " 2>/dev/null";
    FILE *pipe = popen(fullCmd.c_str(), "r");
    if (!pipe) {
        BufferedLogger::globalLogger()->error("cannot execute " + cmd);
        return -1;
    }
    
    array<char, 4096> buffer{};
    outputOut.clear();
    size_t n;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        outputOut.append(buffer.data(), n);
    }
    
    int status = pclose(pipe);
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

string CommandRunner::shellQuote(const string &arg) {
    string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}
