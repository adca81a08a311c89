//
//  FirmwareSource.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "FirmwareSource.hpp"
#include <brcmprobe-core/util/StringUtils.h>

using namespace std;
using namespace brcmprobe;

FirmwareSource FirmwareSource::bridge() {
    return FirmwareSource{FirmwareSourceBridge, ""};
}

FirmwareSource FirmwareSource::filesystem(string path) {
    return FirmwareSource{FirmwareSourceFilesystem, path};
}

FirmwareSource FirmwareSource::image(string path) {
    return FirmwareSource{FirmwareSourceImage, path};
}

FirmwareSource FirmwareSource::parse(const string &descriptor) {
    if (descriptor == BP_SOURCE_BRIDGE) {
        return bridge();
    }
    if (StringUtils::has_prefix(descriptor, BP_SOURCE_IMAGE_PREFIX)) {
        return image(descriptor.substr(string(BP_SOURCE_IMAGE_PREFIX).length()));
    }
    return filesystem(descriptor);
}

const char* FirmwareSource::kindName(FirmwareSourceKind kind) {
    switch (kind) {
        case FirmwareSourceBridge:
            return "bridge";
        case FirmwareSourceFilesystem:
            return "filesystem";
        case FirmwareSourceImage:
            return "image";
    }
    return "unknown";
}

string FirmwareSource::description() const {
    if (kind == FirmwareSourceBridge) {
        return "android device via adb";
    }
    return StringUtils::format("%s %s", kindName(kind), path.c_str());
}
