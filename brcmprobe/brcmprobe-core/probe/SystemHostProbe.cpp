//
//  SystemHostProbe.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "SystemHostProbe.hpp"
#include "CommandRunner.hpp"
#include <brcmprobe-core/util/StringUtils.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fnmatch.h>

using namespace std;
using namespace brcmprobe;
namespace fs = std::filesystem;

shared_ptr<HostProbe> HostProbe::systemProbe(const ProbeConfig &config) {
    shared_ptr<HostProbe> probe = make_shared<HostProbe>();
    probe->deviceTree = make_shared<SystemDeviceTreeReader>(config.deviceTreeModelPath);
    probe->properties = make_shared<SystemPropertyReader>(config.propertyTool);
    probe->kernelLog = make_shared<SystemKernelLogReader>(config.kernelLogTool);
    probe->firmwareDirs = make_shared<SystemFirmwareDirectoryLister>();
    probe->firmwareSearchDirs = config.localFirmwareDirs;
    return probe;
}

bool SystemDeviceTreeReader::readModel(string &modelOut) {
    ifstream file(modelPath, ios::binary);
    if (!file.is_open()) {
        return false;
    }
    stringstream ss;
    ss << file.rdbuf();
    modelOut = StringUtils::trim(StringUtils::strip_nul(ss.str()));
    return !modelOut.empty();
}

bool SystemPropertyReader::isAvailable() {
    return CommandRunner::isToolAvailable(tool);
}

bool SystemPropertyReader::getProperty(const string &key, string &valueOut) {
    if (!isAvailable()) {
        return false;
    }
    string output;
    int status = CommandRunner::run(CommandRunner::shellQuote(tool) + " " + CommandRunner::shellQuote(key), output);
    if (status != 0) {
        return false;
    }
    valueOut = StringUtils::trim(output);
    return !valueOut.empty();
}

bool SystemKernelLogReader::readLog(string &logOut) {
    if (!CommandRunner::isToolAvailable(tool)) {
        return false;
    }
    // dmesg_restrict hosts exit non-zero, that is the same as no log
    int status = CommandRunner::run(CommandRunner::shellQuote(tool), logOut);
    return status == 0 && !logOut.empty();
}

bool SystemFirmwareDirectoryLister::isDirectory(const string &dir) {
    error_code ec;
    return fs::is_directory(dir, ec);
}

bool SystemFirmwareDirectoryLister::findFiles(const string &dir, const string &pattern, vector<string> &filesOut) {
    error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return false;
    }
    
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return false;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        error_code statError;
        if (!it->is_regular_file(statError)) {
            continue;
        }
        string fileName = it->path().filename().string();
        if (fnmatch(pattern.c_str(), fileName.c_str(), 0) == 0) {
            filesOut.push_back(it->path().string());
        }
    }
    sort(filesOut.begin(), filesOut.end());
    return true;
}
