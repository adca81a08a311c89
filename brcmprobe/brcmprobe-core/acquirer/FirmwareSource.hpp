//
//  FirmwareSource.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef FirmwareSource_hpp
#define FirmwareSource_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <string>

NS_BP_BEGIN

#define BP_SOURCE_BRIDGE "adb"
#define BP_SOURCE_IMAGE_PREFIX "image:"

enum FirmwareSourceKind {
    FirmwareSourceBridge = 0,
    FirmwareSourceFilesystem,
    FirmwareSourceImage
};

struct FirmwareSource {
    FirmwareSourceKind kind;
    // empty for the bridge
    std::string path;
    
    static FirmwareSource bridge();
    static FirmwareSource filesystem(std::string path);
    static FirmwareSource image(std::string path);
    
    // "adb", "image:<path>" or a filesystem path
    static FirmwareSource parse(const std::string &descriptor);
    static const char* kindName(FirmwareSourceKind kind);
    std::string description() const;
};

NS_BP_END

#endif /* FirmwareSource_hpp */
