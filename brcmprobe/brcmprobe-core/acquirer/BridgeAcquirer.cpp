//
//  BridgeAcquirer.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "BridgeAcquirer.hpp"
#include "FirmwareNameMatcher.hpp"
#include <brcmprobe-core/util/StringUtils.h>
#include <algorithm>

using namespace std;
using namespace brcmprobe;

bp_return_t BridgeAcquirer::acquire(const FirmwareSource &source, vector<AcquiredBinary> &binariesOut) {
    BufferedLogger *logger = BufferedLogger::globalLogger();
    logger->info("Extracting firmware from Android device via ADB...");
    
    if (!bridge || !bridge->isInstalled()) {
        logger->error("ADB not found. Please install Android SDK platform-tools.");
        return BP_SOURCE_UNAVAILABLE;
    }
    
    vector<string> devices = bridge->authorizedDevices();
    if (devices.empty()) {
        logger->error("No Android device connected or unauthorized");
        logger->info("Enable USB debugging and authorize this computer");
        return BP_SOURCE_UNAVAILABLE;
    }
    bridge->selectDevice(devices[0]);
    logger->success("Device connected: " + devices[0]);
    
    string firmwareDir;
    vector<string> matches;
    size_t listFailures = 0;
    for (const string &remoteDir : remoteDirs) {
        logger->info("Checking " + remoteDir + "...");
        vector<string> names;
        if (!bridge->listDirectory(remoteDir, names)) {
            logger->warning("Cannot list " + remoteDir + " on " + devices[0]);
            listFailures++;
            continue;
        }
        for (const string &name : names) {
            if (FirmwareNameMatcher::matches(name)) {
                matches.push_back(name);
            }
        }
        if (!matches.empty()) {
            firmwareDir = remoteDir;
            break;
        }
    }
    
    if (matches.empty() && !remoteDirs.empty() && listFailures == remoteDirs.size()) {
        logger->error("Cannot list firmware directories on device " + devices[0]);
        return BP_SOURCE_UNAVAILABLE;
    }
    if (matches.empty()) {
        logger->warning("No firmware files found on device");
        return BP_NO_FILES_FOUND;
    }
    sort(matches.begin(), matches.end());
    matches.erase(unique(matches.begin(), matches.end()), matches.end());
    logger->success("Found firmware files in " + firmwareDir);
    
    if (!staging || staging->resetWorkDir() != 0) {
        logger->error("cannot prepare staging area");
        return BP_TRANSFER_FAILED;
    }
    
    // one failed pull never stops the remaining ones
    for (const string &name : matches) {
        string remotePath = StringUtils::path_join(firmwareDir, name);
        string localPath = staging->pathForFile(name);
        logger->info("Pulling " + name + "...");
        
        AcquiredBinary binary;
        if (!bridge->pull(remotePath, localPath) ||
            !AcquiredBinary::loadFromFile(localPath, binary.bytes)) {
            logger->warning("Failed to pull " + remotePath);
            transferFailures.push_back(name);
            continue;
        }
        binary.filename = name;
        binary.originPath = remotePath;
        binariesOut.push_back(binary);
    }
    sortBinaries(binariesOut);
    
    if (binariesOut.empty()) {
        logger->error("Every transfer from " + firmwareDir + " failed");
        return BP_TRANSFER_FAILED;
    }
    if (!transferFailures.empty()) {
        logger->warning(StringUtils::format("%lu of %lu file(s) could not be transferred", (unsigned long)transferFailures.size(), (unsigned long)matches.size()));
        return BP_PARTIAL_TRANSFER;
    }
    return BP_SUCCESS;
}
