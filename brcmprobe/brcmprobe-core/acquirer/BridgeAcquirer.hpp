//
//  BridgeAcquirer.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef BridgeAcquirer_hpp
#define BridgeAcquirer_hpp

#include <brcmprobe-core/acquirer/Acquirer.hpp>
#include <brcmprobe-core/acquirer/bridge/BridgeTool.hpp>

NS_BP_BEGIN

class BridgeAcquirer : public Acquirer {
public:
    BridgeAcquirer(std::string name, std::string desc, std::shared_ptr<BridgeTool> bridge, std::vector<std::string> remoteDirs):
        Acquirer(name, desc),
        bridge(bridge),
        remoteDirs(remoteDirs)
    {}
    
    virtual ~BridgeAcquirer() {};
    virtual bp_return_t acquire(const FirmwareSource &source, std::vector<AcquiredBinary> &binariesOut);
    
private:
    std::shared_ptr<BridgeTool> bridge;
    std::vector<std::string> remoteDirs;
};

NS_BP_END

#endif /* BridgeAcquirer_hpp */
