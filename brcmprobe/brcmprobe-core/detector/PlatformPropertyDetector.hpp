//
//  PlatformPropertyDetector.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef PlatformPropertyDetector_hpp
#define PlatformPropertyDetector_hpp

#include <brcmprobe-core/detector/Detector.hpp>

NS_BP_BEGIN

class PlatformPropertyDetector : public Detector {
public:
    PlatformPropertyDetector(std::string name, std::string desc): Detector(name, desc) {}
    
    virtual ~PlatformPropertyDetector() {};
    virtual bool tryDetect(HostProbe &probe, DeviceSignature &signature, DetectionAttempt &attempt, DetectionResult &resultOut);
    
private:
    std::string readProperty(PropertyReader &reader, const std::string &key);
};

NS_BP_END

#endif /* PlatformPropertyDetector_hpp */
