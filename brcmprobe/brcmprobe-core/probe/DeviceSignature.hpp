//
//  DeviceSignature.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef DeviceSignature_hpp
#define DeviceSignature_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <map>
#include <string>

NS_BP_BEGIN

enum SignatureKind {
    SignatureKindDeviceTreeModel = 0,
    SignatureKindPlatformProperties,
    SignatureKindKernelLog,
    SignatureKindFirmwareFilename
};

class DeviceSignature {
public:
    void capture(SignatureKind kind, std::string text);
    bool has(SignatureKind kind) const;
    std::string get(SignatureKind kind) const;
    const std::map<SignatureKind, std::string>& all() const;
    
    static const char* kindName(SignatureKind kind);
    
private:
    std::map<SignatureKind, std::string> observed;
};

NS_BP_END

#endif /* DeviceSignature_hpp */
