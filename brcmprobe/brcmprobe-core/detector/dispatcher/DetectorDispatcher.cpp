//
//  DetectorDispatcher.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "DetectorDispatcher.hpp"
#include <brcmprobe-core/detector/DeviceTreeDetector.hpp>
#include <brcmprobe-core/detector/PlatformPropertyDetector.hpp>
#include <brcmprobe-core/detector/KernelLogDetector.hpp>
#include <brcmprobe-core/detector/FirmwareFileDetector.hpp>
#include <brcmprobe-core/util/StringUtils.h>
#include <set>

using namespace std;
using namespace brcmprobe;

const char* brcmprobe::confidenceName(Confidence confidence) {
    switch (confidence) {
        case ConfidenceExact:
            return "exact";
        case ConfidenceLikely:
            return "likely";
    }
    return "unknown";
}

DetectorDispatcher::DetectorDispatcher() {
    this->registerDetector("device-tree", []() {
        return new DeviceTreeDetector("device-tree", "match the device-tree board model against known boards");
    });
    
    this->registerDetector("platform-properties", []() {
        return new PlatformPropertyDetector("platform-properties", "match the android device codename against known devices");
    });
    
    this->registerDetector("kernel-log", []() {
        return new KernelLogDetector("kernel-log", "scan broadcom kernel log lines for chip family numbers");
    });
    
    this->registerDetector("firmware-files", []() {
        return new FirmwareFileDetector("firmware-files", "match installed brcmfmac firmware file names");
    });
}

void DetectorDispatcher::registerDetector(string detectorId, DetectorProvider provider) {
    for (auto it = detectorChain.begin(); it != detectorChain.end(); it++) {
        if (it->first == detectorId) {
            it->second = provider;
            return;
        }
    }
    detectorChain.push_back({detectorId, provider});
}

bool DetectorDispatcher::reorder(vector<string> detectorIds) {
    if (detectorIds.size() != detectorChain.size()) {
        return false;
    }
    
    vector<pair<string, DetectorProvider>> reordered;
    set<string> seen;
    for (const string &detectorId : detectorIds) {
        if (seen.find(detectorId) != seen.end()) {
            return false;
        }
        seen.insert(detectorId);
        
        bool found = false;
        for (auto &entry : detectorChain) {
            if (entry.first == detectorId) {
                reordered.push_back(entry);
                found = true;
                break;
            }
        }
        if (!found) {
            return false;
        }
    }
    detectorChain = reordered;
    return true;
}

vector<string> DetectorDispatcher::strategyOrder() {
    vector<string> order;
    for (auto &entry : detectorChain) {
        order.push_back(entry.first);
    }
    return order;
}

vector<Detector *> DetectorDispatcher::allDetectors() {
    vector<Detector *> detectors;
    for (auto it = detectorChain.begin(); it != detectorChain.end(); it++) {
        detectors.push_back(it->second());
    }
    return detectors;
}

bool DetectorDispatcher::detect(HostProbe &probe, DetectionOutcome &outcomeOut) {
    BufferedLogger *logger = BufferedLogger::globalLogger();
    outcomeOut.detected = false;
    
    for (auto &entry : detectorChain) {
        Detector *d = entry.second();
        DetectionAttempt attempt;
        attempt.strategyId = d->identifier;
        
        DetectionResult result;
        bool matched = d->tryDetect(probe, outcomeOut.signature, attempt, result);
        attempt.matched = matched;
        outcomeOut.attempts.push_back(attempt);
        delete d;
        
        if (matched) {
            logger->success(StringUtils::format("detector %s identified %lu chip(s), confidence %s", entry.first.c_str(), (unsigned long)result.chips.size(), confidenceName(result.confidence)));
            outcomeOut.detected = true;
            outcomeOut.result = result;
            return true;
        }
        logger->info(StringUtils::format("detector %s declined", entry.first.c_str()));
    }
    return false;
}
