//
//  DeviceTreeDetector.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef DeviceTreeDetector_hpp
#define DeviceTreeDetector_hpp

#include <brcmprobe-core/detector/Detector.hpp>

NS_BP_BEGIN

class DeviceTreeDetector : public Detector {
public:
    DeviceTreeDetector(std::string name, std::string desc): Detector(name, desc) {}
    
    virtual ~DeviceTreeDetector() {};
    virtual bool tryDetect(HostProbe &probe, DeviceSignature &signature, DetectionAttempt &attempt, DetectionResult &resultOut);
};

NS_BP_END

#endif /* DeviceTreeDetector_hpp */
