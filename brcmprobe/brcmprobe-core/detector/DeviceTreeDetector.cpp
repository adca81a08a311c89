//
//  DeviceTreeDetector.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "DeviceTreeDetector.hpp"
#include <brcmprobe-core/util/StringUtils.h>

using namespace std;
using namespace brcmprobe;

bool DeviceTreeDetector::tryDetect(HostProbe &probe, DeviceSignature &signature, DetectionAttempt &attempt, DetectionResult &resultOut) {
    attempt.title = "Device-tree Board Model";
    
    string model;
    if (!probe.deviceTree || !probe.deviceTree->readModel(model)) {
        attempt.plain("device-tree model not available");
        return false;
    }
    attempt.sourcePresent = true;
    signature.capture(SignatureKindDeviceTreeModel, model);
    attempt.info("Model: " + model);
    
    const CatalogMatcher *matcher = catalog->match(CatalogTableBoardModel, model);
    const ChipProfile *profile = matcher ? catalog->profileForChip(matcher->chipId) : nullptr;
    if (!profile) {
        attempt.warning("Unknown board model");
        return false;
    }
    
    attempt.success("Board: " + matcher->label);
    attempt.success("Chip: " + profile->chipId);
    resultOut.strategyId = identifier;
    resultOut.confidence = ConfidenceExact;
    resultOut.chips = {profile};
    resultOut.evidence = model;
    return true;
}
