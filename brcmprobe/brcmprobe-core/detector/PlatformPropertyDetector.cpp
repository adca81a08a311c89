//
//  PlatformPropertyDetector.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "PlatformPropertyDetector.hpp"
#include <brcmprobe-core/util/StringUtils.h>

using namespace std;
using namespace brcmprobe;

string PlatformPropertyDetector::readProperty(PropertyReader &reader, const string &key) {
    string value;
    if (!reader.getProperty(key, value) || value.empty()) {
        return "Unknown";
    }
    return value;
}

bool PlatformPropertyDetector::tryDetect(HostProbe &probe, DeviceSignature &signature, DetectionAttempt &attempt, DetectionResult &resultOut) {
    attempt.title = "Android Platform Properties";
    
    if (!probe.properties || !probe.properties->isAvailable()) {
        attempt.plain("platform property reader not available");
        return false;
    }
    attempt.sourcePresent = true;
    
    string manufacturer = readProperty(*probe.properties, "ro.product.manufacturer");
    string model = readProperty(*probe.properties, "ro.product.model");
    string device = readProperty(*probe.properties, "ro.product.device");
    signature.capture(SignatureKindPlatformProperties, StringUtils::format("manufacturer=%s;model=%s;device=%s", manufacturer.c_str(), model.c_str(), device.c_str()));
    
    attempt.info("Manufacturer: " + manufacturer);
    attempt.info("Model: " + model);
    attempt.info("Device: " + device);
    
    const CatalogMatcher *matcher = catalog->match(CatalogTableDeviceCodename, device);
    const ChipProfile *profile = matcher ? catalog->profileForChip(matcher->chipId) : nullptr;
    if (!profile) {
        attempt.warning("Device not in known database");
        attempt.info("Check /vendor/firmware/ for firmware files");
        return false;
    }
    
    attempt.success("Detected: " + matcher->label);
    attempt.success("Chip: " + profile->chipId);
    resultOut.strategyId = identifier;
    resultOut.confidence = ConfidenceExact;
    resultOut.chips = {profile};
    resultOut.evidence = device;
    return true;
}
