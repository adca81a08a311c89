//
//  AcquirerDispatcher.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef AcquirerDispatcher_hpp
#define AcquirerDispatcher_hpp

#include <functional>
#include <map>
#include <memory>
#include <brcmprobe-core/acquirer/Acquirer.hpp>
#include <brcmprobe-core/acquirer/ImageAcquirer.hpp>
#include <brcmprobe-core/acquirer/bridge/BridgeTool.hpp>
#include <brcmprobe-core/config/ProbeConfig.hpp>

NS_BP_BEGIN

typedef std::function<Acquirer* (void)> AcquirerProvider;

class AcquirerDispatcher {
public:
    // a null bridge means the adb bridge named by the config
    AcquirerDispatcher(const ProbeConfig &config, std::shared_ptr<BridgeTool> bridge = nullptr, std::shared_ptr<ImageMounter> mounter = nullptr);
    void registerAcquirer(FirmwareSourceKind kind, AcquirerProvider provider);
    
    // transfer failures of the last run, for the report
    std::vector<std::string> lastTransferFailures;
    
    bp_return_t start(const FirmwareSource &source, std::string chipHint, std::string versionHint, std::vector<AcquiredBinary> &binariesOut);
    Acquirer* prepareForAcquirer(const FirmwareSource &source, std::string chipHint, std::string versionHint);
    
private:
    std::map<FirmwareSourceKind, AcquirerProvider> acquirerMap;
    std::shared_ptr<StagingDirManager> staging;
};

NS_BP_END

#endif /* AcquirerDispatcher_hpp */
