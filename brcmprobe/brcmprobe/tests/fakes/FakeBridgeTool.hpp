//
//  FakeBridgeTool.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef FakeBridgeTool_hpp
#define FakeBridgeTool_hpp

#include <brcmprobe-core/acquirer/bridge/BridgeTool.hpp>
#include <brcmprobe-core/util/StringUtils.h>
#include <fstream>
#include <map>
#include <set>

NS_BP_BEGIN

class FakeBridgeTool : public BridgeTool {
public:
    bool installed = true;
    std::vector<std::string> devices{"emulator-5554"};
    // remote dir -> file names
    std::map<std::string, std::vector<std::string>> remoteTree;
    // remote file names whose pull fails
    std::set<std::string> brokenFiles;
    // remote dirs whose listing command fails
    std::set<std::string> failingDirs;
    std::vector<std::string> pulledPaths;
    std::string selectedDevice;
    
    std::string name() { return "fake-adb"; }
    bool isInstalled() { return installed; }
    std::vector<std::string> authorizedDevices() { return devices; }
    void selectDevice(const std::string &serial) { selectedDevice = serial; }
    
    // several endpoints and none selected fails like adb does
    bool ambiguousTarget() {
        return devices.size() > 1 && selectedDevice.empty();
    }
    
    bool listDirectory(const std::string &remoteDir, std::vector<std::string> &namesOut) {
        if (ambiguousTarget() || failingDirs.find(remoteDir) != failingDirs.end()) {
            return false;
        }
        auto it = remoteTree.find(remoteDir);
        if (it != remoteTree.end()) {
            namesOut = it->second;
        }
        return true;
    }
    
    bool pull(const std::string &remotePath, const std::string &localPath) {
        if (ambiguousTarget()) {
            return false;
        }
        std::string fileName = StringUtils::last_path_component(remotePath);
        if (brokenFiles.find(fileName) != brokenFiles.end()) {
            return false;
        }
        std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << "firmware:" << remotePath;
        pulledPaths.push_back(remotePath);
        return true;
    }
};

NS_BP_END

#endif /* FakeBridgeTool_hpp */
