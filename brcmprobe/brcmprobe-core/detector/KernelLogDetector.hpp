//
//  KernelLogDetector.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef KernelLogDetector_hpp
#define KernelLogDetector_hpp

#include <brcmprobe-core/detector/Detector.hpp>

NS_BP_BEGIN

class KernelLogDetector : public Detector {
public:
    KernelLogDetector(std::string name, std::string desc): Detector(name, desc) {}
    
    virtual ~KernelLogDetector() {};
    virtual bool tryDetect(HostProbe &probe, DeviceSignature &signature, DetectionAttempt &attempt, DetectionResult &resultOut);
    
    static std::vector<std::string> vendorLines(const std::string &log);
};

NS_BP_END

#endif /* KernelLogDetector_hpp */
