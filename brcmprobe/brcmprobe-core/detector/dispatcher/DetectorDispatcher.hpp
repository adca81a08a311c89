//
//  DetectorDispatcher.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef DetectorDispatcher_hpp
#define DetectorDispatcher_hpp

#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <brcmprobe-core/detector/Detector.hpp>

NS_BP_BEGIN

typedef std::function<Detector* (void)> DetectorProvider;

struct DetectionOutcome {
    DeviceSignature signature;
    std::vector<DetectionAttempt> attempts;
    bool detected = false;
    DetectionResult result;
};

class DetectorDispatcher {
public:
    DetectorDispatcher();
    
    // a new id is appended with the lowest priority, a known id is replaced in place
    void registerDetector(std::string detectorId, DetectorProvider provider);
    bool reorder(std::vector<std::string> detectorIds);
    std::vector<std::string> strategyOrder();
    std::vector<Detector *> allDetectors();
    
    // Runs the chain strictly in priority order and stops at the first
    // detector reporting a chip. Returns false when every detector declines.
    bool detect(HostProbe &probe, DetectionOutcome &outcomeOut);
    
private:
    std::vector<std::pair<std::string, DetectorProvider>> detectorChain;
};

NS_BP_END

#endif /* DetectorDispatcher_hpp */
