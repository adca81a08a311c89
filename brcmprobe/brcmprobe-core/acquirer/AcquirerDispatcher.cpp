//
//  AcquirerDispatcher.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "AcquirerDispatcher.hpp"
#include "BridgeAcquirer.hpp"
#include "FilesystemAcquirer.hpp"
#include <brcmprobe-core/acquirer/bridge/AdbBridge.hpp>

using namespace std;
using namespace brcmprobe;

AcquirerDispatcher::AcquirerDispatcher(const ProbeConfig &config, shared_ptr<BridgeTool> bridge, shared_ptr<ImageMounter> mounter) {
    staging = make_shared<StagingDirManager>(config.stagingDir);
    if (!bridge) {
        bridge = make_shared<AdbBridge>(config.bridgeTool);
    }
    vector<string> remoteDirs = config.remoteFirmwareDirs;
    
    this->registerAcquirer(FirmwareSourceBridge, [bridge, remoteDirs]() {
        return new BridgeAcquirer("bridge", "pull firmware from a connected device", bridge, remoteDirs);
    });
    
    this->registerAcquirer(FirmwareSourceFilesystem, []() {
        return new FilesystemAcquirer("filesystem", "copy firmware from a local directory");
    });
    
    this->registerAcquirer(FirmwareSourceImage, [mounter]() {
        return new ImageAcquirer("image", "copy firmware from a mounted firmware image", mounter);
    });
}

void AcquirerDispatcher::registerAcquirer(FirmwareSourceKind kind, AcquirerProvider provider) {
    acquirerMap[kind] = provider;
}

bp_return_t AcquirerDispatcher::start(const FirmwareSource &source, string chipHint, string versionHint, vector<AcquiredBinary> &binariesOut) {
    lastTransferFailures.clear();
    Acquirer *a = prepareForAcquirer(source, chipHint, versionHint);
    if (!a) {
        return BP_SOURCE_UNAVAILABLE;
    }
    
    bp_return_t ret = a->acquire(source, binariesOut);
    lastTransferFailures = a->transferFailures;
    delete a;
    return ret;
}

Acquirer* AcquirerDispatcher::prepareForAcquirer(const FirmwareSource &source, string chipHint, string versionHint) {
    if (acquirerMap.find(source.kind) == acquirerMap.end()) {
        BufferedLogger::globalLogger()->error(string("AcquirerDispatcher Error: cannot find acquirer for ") + FirmwareSource::kindName(source.kind));
        return nullptr;
    }
    
    Acquirer *a = acquirerMap[source.kind]();
    a->chipHint = chipHint;
    a->versionHint = versionHint;
    a->staging = staging;
    return a;
}
