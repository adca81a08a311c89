//
//  FirmwareFileDetector.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "FirmwareFileDetector.hpp"
#include <brcmprobe-core/util/StringUtils.h>
#include <algorithm>

#define HostFirmwarePattern "brcmfmac*.bin"

using namespace std;
using namespace brcmprobe;

bool FirmwareFileDetector::tryDetect(HostProbe &probe, DeviceSignature &signature, DetectionAttempt &attempt, DetectionResult &resultOut) {
    attempt.title = "Firmware Files";
    
    if (!probe.firmwareDirs) {
        attempt.plain("firmware directories not available");
        return false;
    }
    
    string firmwareDir;
    vector<string> fileNames;
    for (const string &dir : probe.firmwareSearchDirs) {
        if (!probe.firmwareDirs->isDirectory(dir)) {
            continue;
        }
        vector<string> files;
        if (!probe.firmwareDirs->findFiles(dir, HostFirmwarePattern, files) || files.empty()) {
            continue;
        }
        firmwareDir = dir;
        for (const string &file : files) {
            fileNames.push_back(StringUtils::last_path_component(file));
        }
        break;
    }
    
    if (fileNames.empty()) {
        attempt.plain("no brcmfmac firmware files in known locations");
        return false;
    }
    sort(fileNames.begin(), fileNames.end());
    attempt.sourcePresent = true;
    signature.capture(SignatureKindFirmwareFilename, StringUtils::join(fileNames, "\n"));
    attempt.info("Location: " + firmwareDir);
    
    vector<const ChipProfile *> chips;
    for (const string &fileName : fileNames) {
        attempt.plain("  • " + fileName);
        const CatalogMatcher *matcher = catalog->match(CatalogTableChipFragment, fileName);
        const ChipProfile *profile = matcher ? catalog->profileForChip(matcher->chipId) : nullptr;
        if (!profile) {
            continue;
        }
        attempt.plain(StringUtils::format("    → %s (%s)", profile->chipId.c_str(), matcher->label.c_str()));
        if (find(chips.begin(), chips.end(), profile) == chips.end()) {
            chips.push_back(profile);
        }
    }
    
    if (chips.empty()) {
        attempt.warning("no firmware file matches a known chip family");
        return false;
    }
    
    resultOut.strategyId = identifier;
    resultOut.confidence = ConfidenceLikely;
    resultOut.chips = chips;
    resultOut.evidence = firmwareDir;
    return true;
}
