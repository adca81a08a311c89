//
//  FirmwareFileDetector.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef FirmwareFileDetector_hpp
#define FirmwareFileDetector_hpp

#include <brcmprobe-core/detector/Detector.hpp>

NS_BP_BEGIN

class FirmwareFileDetector : public Detector {
public:
    FirmwareFileDetector(std::string name, std::string desc): Detector(name, desc) {}
    
    virtual ~FirmwareFileDetector() {};
    virtual bool tryDetect(HostProbe &probe, DeviceSignature &signature, DetectionAttempt &attempt, DetectionResult &resultOut);
};

NS_BP_END

#endif /* FirmwareFileDetector_hpp */
