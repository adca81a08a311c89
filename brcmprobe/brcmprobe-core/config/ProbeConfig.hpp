//
//  ProbeConfig.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef ProbeConfig_hpp
#define ProbeConfig_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <map>
#include <string>
#include <vector>

NS_BP_BEGIN

#define BP_ENV_ROOT "BRCMPROBE_ROOT"
#define BP_ENV_STAGING "BRCMPROBE_STAGING"
#define BP_ENV_ADB "BRCMPROBE_ADB"

class ProbeConfig {
public:
    ProbeConfig();
    
    // project root, parent of firmwares/ and patches/
    std::string rootDir;
    std::string stagingDir;
    std::string bridgeTool;
    std::string propertyTool;
    std::string kernelLogTool;
    std::string deviceTreeModelPath;
    std::vector<std::string> localFirmwareDirs;
    std::vector<std::string> remoteFirmwareDirs;
    
    std::string defaultOutputRoot() const;
    
    void applyEnvironment();
    bp_return_t applyOptions(const std::map<std::string, std::string> &options, std::string &errorOut);
    
    // "k=v;k=v" as passed with -d
    static bp_return_t parseExtraData(const std::string &extraData, std::map<std::string, std::string> &optionsOut, std::string &errorOut);
    static std::vector<std::string> supportedKeys();
};

NS_BP_END

#endif /* ProbeConfig_hpp */
