//
//  ExtractionPipeline.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef ExtractionPipeline_hpp
#define ExtractionPipeline_hpp

#include <brcmprobe-core/acquirer/AcquirerDispatcher.hpp>
#include <brcmprobe-core/config/ProbeConfig.hpp>
#include <brcmprobe-core/detector/dispatcher/DetectorDispatcher.hpp>
#include <brcmprobe-core/probe/HostProbe.hpp>
#include <brcmprobe-core/scaffold/ExtractionResult.hpp>
#include <memory>
#include <string>
#include <vector>

NS_BP_BEGIN

struct ExtractionRequest {
    std::string sourceDescriptor;
    std::string chipId;
    std::string versionId;
    // empty means <root>/firmwares
    std::string outputRoot;
    // fill a missing chip or version from the detection chain
    bool detect = false;
};

class ExtractionPipeline {
public:
    // null collaborators fall back to the real host, adb and no image mounter
    ExtractionPipeline(const ProbeConfig &config,
                       std::shared_ptr<HostProbe> probe = nullptr,
                       std::shared_ptr<BridgeTool> bridge = nullptr,
                       std::shared_ptr<ImageMounter> mounter = nullptr);
    
    ExtractionResult run(const ExtractionRequest &request);
    
    // set when run() consulted the detection chain
    bool ranDetection;
    DetectionOutcome detection;
    
    // first binary carrying the chip family number, else the first one
    static const AcquiredBinary* selectBinary(const std::vector<AcquiredBinary> &binaries, const std::string &chipId);
    
private:
    ProbeConfig config;
    std::shared_ptr<HostProbe> probe;
    std::shared_ptr<BridgeTool> bridge;
    std::shared_ptr<ImageMounter> mounter;
    
    bool resolveTarget(ExtractionRequest &request, ExtractionResult &result);
    bool validateRequest(const ExtractionRequest &request, ExtractionResult &result);
};

NS_BP_END

#endif /* ExtractionPipeline_hpp */
