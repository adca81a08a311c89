//
//  Detector.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef Detector_hpp
#define Detector_hpp

#include <brcmprobe-core/catalog/ChipCatalog.hpp>
#include <brcmprobe-core/probe/DeviceSignature.hpp>
#include <brcmprobe-core/probe/HostProbe.hpp>
#include <brcmprobe-core/log/buffered_logger.hpp>
#include <string>
#include <vector>

NS_BP_BEGIN

enum Confidence {
    // trusted hardware identity
    ConfidenceExact = 0,
    // best-effort guess, never presented as certain
    ConfidenceLikely
};

struct DetectionResult {
    std::string strategyId;
    Confidence confidence = ConfidenceLikely;
    std::vector<const ChipProfile *> chips;
    std::string evidence;
    
    bool isAmbiguous() const { return chips.size() > 1; }
};

struct DetectionAttempt {
    std::string strategyId;
    std::string title;
    bool sourcePresent = false;
    bool matched = false;
    std::vector<LogEntry> lines;
    
    void info(std::string line) { lines.push_back({LogLevelInfo, line}); }
    void success(std::string line) { lines.push_back({LogLevelSuccess, line}); }
    void warning(std::string line) { lines.push_back({LogLevelWarning, line}); }
    void plain(std::string line) { lines.push_back({LogLevelPlain, line}); }
};

const char* confidenceName(Confidence confidence);

class Detector {
public:
    Detector(std::string identifier, std::string desc):
        identifier(identifier),
        desc(desc),
        catalog(ChipCatalog::sharedCatalog())
    {}
    
    virtual ~Detector() {};
    std::string identifier;
    std::string desc;
    const ChipCatalog *catalog;
    
    // Returns true and fills resultOut when the strategy identifies a chip.
    // A missing signal source is a decline, never an error.
    virtual bool tryDetect(HostProbe &probe, DeviceSignature &signature, DetectionAttempt &attempt, DetectionResult &resultOut) = 0;
};

NS_BP_END

#endif /* Detector_hpp */
