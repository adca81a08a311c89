//
//  AdbBridge.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "AdbBridge.hpp"
#include <brcmprobe-core/probe/CommandRunner.hpp>
#include <brcmprobe-core/util/StringUtils.h>
#include <sstream>

using namespace std;
using namespace brcmprobe;

string AdbBridge::name() {
    return adbPath;
}

string AdbBridge::adb() {
    return CommandRunner::shellQuote(adbPath);
}

string AdbBridge::commandFor(const string &subcommand) {
    if (serial.empty()) {
        return adb() + " " + subcommand;
    }
    return adb() + " -s " + CommandRunner::shellQuote(serial) + " " + subcommand;
}

void AdbBridge::selectDevice(const string &serial) {
    this->serial = serial;
}

bool AdbBridge::isInstalled() {
    return CommandRunner::isToolAvailable(adbPath);
}

vector<string> AdbBridge::parseDeviceList(const string &output) {
    vector<string> serials;
    for (const string &line : StringUtils::split_lines(output)) {
        if (StringUtils::has_prefix(line, "List of devices") || StringUtils::has_prefix(line, "*")) {
            continue;
        }
        stringstream ss(line);
        string serial, state;
        if (!(ss >> serial >> state)) {
            continue;
        }
        if (state == "device") {
            serials.push_back(serial);
        }
    }
    return serials;
}

vector<string> AdbBridge::authorizedDevices() {
    string output;
    if (CommandRunner::run(adb() + " devices", output) != 0) {
        return {};
    }
    return parseDeviceList(output);
}

bool AdbBridge::listDirectory(const string &remoteDir, vector<string> &namesOut) {
    string output;
    // a missing directory is an empty listing, any other failure is not
    string quotedDir = CommandRunner::shellQuote(remoteDir);
    string remoteCmd = "[ ! -d " + quotedDir + " ] || ls " + quotedDir;
    if (CommandRunner::run(commandFor("shell " + CommandRunner::shellQuote(remoteCmd)), output) != 0) {
        return false;
    }
    for (const string &line : StringUtils::split_lines(output)) {
        string name = StringUtils::trim(line);
        // older adbd prints errors on stdout
        if (name.empty() || name.find("No such file") != string::npos || name.find("Permission denied") != string::npos) {
            continue;
        }
        namesOut.push_back(StringUtils::last_path_component(name));
    }
    return true;
}

bool AdbBridge::pull(const string &remotePath, const string &localPath) {
    string output;
    return CommandRunner::run(commandFor("pull " + CommandRunner::shellQuote(remotePath) + " " + CommandRunner::shellQuote(localPath)), output) == 0;
}
