//
//  DetectionReport.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef DetectionReport_hpp
#define DetectionReport_hpp

#include <brcmprobe-core/detector/dispatcher/DetectorDispatcher.hpp>
#include <brcmprobe-core/log/buffered_logger.hpp>
#include <vector>

NS_BP_BEGIN

class DetectionReport {
public:
    // one section per attempt, then recommendations or manual steps
    static std::vector<LogEntry> render(const DetectionOutcome &outcome);
    
    static std::vector<LogEntry> renderAttempt(const DetectionAttempt &attempt);
    static std::vector<LogEntry> renderRecommendations(const DetectionResult &result);
    static std::vector<LogEntry> renderManualSteps();
    static std::vector<LogEntry> renderNextSteps();
};

NS_BP_END

#endif /* DetectionReport_hpp */
