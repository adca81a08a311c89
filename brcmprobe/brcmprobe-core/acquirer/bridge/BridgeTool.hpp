//
//  BridgeTool.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef BridgeTool_hpp
#define BridgeTool_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <string>
#include <vector>

NS_BP_BEGIN

// remote-shell bridge to a connected device
class BridgeTool {
public:
    virtual ~BridgeTool() {};
    virtual std::string name() = 0;
    virtual bool isInstalled() = 0;
    
    // serials of connected and authorized endpoints
    virtual std::vector<std::string> authorizedDevices() = 0;
    
    // later shell and pull calls go to this endpoint only
    virtual void selectDevice(const std::string &serial) = 0;
    
    // file names (not paths) in a remote directory, false if it cannot be listed
    virtual bool listDirectory(const std::string &remoteDir, std::vector<std::string> &namesOut) = 0;
    virtual bool pull(const std::string &remotePath, const std::string &localPath) = 0;
};

NS_BP_END

#endif /* BridgeTool_hpp */
