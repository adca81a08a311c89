//
//  DeviceSignature.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "DeviceSignature.hpp"

using namespace std;
using namespace brcmprobe;

void DeviceSignature::capture(SignatureKind kind, string text) {
    // the first observation of a run is kept
    if (observed.find(kind) != observed.end()) {
        return;
    }
    observed[kind] = text;
}

bool DeviceSignature::has(SignatureKind kind) const {
    return observed.find(kind) != observed.end();
}

string DeviceSignature::get(SignatureKind kind) const {
    auto it = observed.find(kind);
    if (it == observed.end()) {
        return "";
    }
    return it->second;
}

const map<SignatureKind, string>& DeviceSignature::all() const {
    return observed;
}

const char* DeviceSignature::kindName(SignatureKind kind) {
    switch (kind) {
        case SignatureKindDeviceTreeModel:
            return "device-tree-model";
        case SignatureKindPlatformProperties:
            return "platform-properties";
        case SignatureKindKernelLog:
            return "kernel-log";
        case SignatureKindFirmwareFilename:
            return "firmware-filename";
    }
    return "unknown";
}
