//
//  ProbeConfig.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "ProbeConfig.hpp"
#include <brcmprobe-core/util/StringUtils.h>
#include <cstdlib>
#include <unistd.h>

using namespace std;
using namespace brcmprobe;

static string currentWorkingDirectory() {
    size_t size = pathconf(".", _PC_PATH_MAX);
    char *buf = (char *)malloc((size_t)size);
    char *path = getcwd(buf, (size_t)size);
    string cwd = path ? string(path) : "/tmp";
    free(buf);
    return cwd;
}

static vector<string> splitList(const string &value) {
    vector<string> ret;
    for (string item : StringUtils::split(value, ',')) {
        item = StringUtils::trim(item);
        if (!item.empty()) {
            ret.push_back(item);
        }
    }
    return ret;
}

ProbeConfig::ProbeConfig() {
    rootDir = currentWorkingDirectory();
    stagingDir = "/tmp/brcmprobe/";
    bridgeTool = "adb";
    propertyTool = "getprop";
    kernelLogTool = "dmesg";
    deviceTreeModelPath = "/proc/device-tree/model";
    localFirmwareDirs = {
        "/lib/firmware/brcm",
        "/vendor/firmware",
        "/system/vendor/firmware"
    };
    remoteFirmwareDirs = {
        "/vendor/firmware",
        "/system/vendor/firmware",
        "/system/etc/firmware"
    };
}

string ProbeConfig::defaultOutputRoot() const {
    return StringUtils::path_join(rootDir, "firmwares");
}

void ProbeConfig::applyEnvironment() {
    const char *root = getenv(BP_ENV_ROOT);
    if (root && *root) {
        rootDir = root;
    }
    const char *staging = getenv(BP_ENV_STAGING);
    if (staging && *staging) {
        stagingDir = staging;
    }
    const char *adb = getenv(BP_ENV_ADB);
    if (adb && *adb) {
        bridgeTool = adb;
    }
}

vector<string> ProbeConfig::supportedKeys() {
    return {"root", "staging", "adb", "getprop", "dmesg", "devicetree", "fwdirs", "remotedirs"};
}

bp_return_t ProbeConfig::applyOptions(const map<string, string> &options, string &errorOut) {
    for (auto it = options.begin(); it != options.end(); it++) {
        const string &key = it->first;
        const string &value = it->second;
        if (key == "root") {
            rootDir = value;
        } else if (key == "staging") {
            stagingDir = value;
        } else if (key == "adb") {
            bridgeTool = value;
        } else if (key == "getprop") {
            propertyTool = value;
        } else if (key == "dmesg") {
            kernelLogTool = value;
        } else if (key == "devicetree") {
            deviceTreeModelPath = value;
        } else if (key == "fwdirs") {
            localFirmwareDirs = splitList(value);
        } else if (key == "remotedirs") {
            remoteFirmwareDirs = splitList(value);
        } else {
            errorOut = StringUtils::format("unsupported option %s, expected one of %s", key.c_str(), StringUtils::join(supportedKeys(), ", ").c_str());
            return BP_INVALID_ARGUMENTS;
        }
    }
    return BP_SUCCESS;
}

bp_return_t ProbeConfig::parseExtraData(const string &extraData, map<string, string> &optionsOut, string &errorOut) {
    vector<string> ops = StringUtils::split(extraData, ';');
    for (string op : ops) {
        if (StringUtils::trim(op).empty()) {
            continue;
        }
        size_t eq = op.find('=');
        if (eq == string::npos || eq == 0) {
            errorOut = "cannot parse extra data " + op;
            return BP_INVALID_ARGUMENTS;
        }
        optionsOut[StringUtils::trim(op.substr(0, eq))] = StringUtils::trim(op.substr(eq + 1));
    }
    return BP_SUCCESS;
}
