//
//  ResultSerializationManager.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef ResultSerializationManager_hpp
#define ResultSerializationManager_hpp

#include <brcmprobe-core/detector/dispatcher/DetectorDispatcher.hpp>
#include <brcmprobe-core/scaffold/ExtractionResult.hpp>
#include <string>

NS_BP_BEGIN

#define BP_REPORT_VERSION "0.1"

class ResultSerializationManager {
public:
    static std::string detectionReportJSON(const DetectionOutcome &outcome);
    // detection may be null when --detect was not used
    static std::string extractionReportJSON(const ExtractionResult &result, const DetectionOutcome *detection);
    
    static bool storeDetectionReport(std::string path, const DetectionOutcome &outcome);
    static bool storeExtractionReport(std::string path, const ExtractionResult &result, const DetectionOutcome *detection);
    
private:
    static bool storeJSON(std::string path, const std::string &json);
};

NS_BP_END

#endif /* ResultSerializationManager_hpp */
