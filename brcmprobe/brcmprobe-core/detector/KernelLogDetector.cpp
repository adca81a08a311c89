//
//  KernelLogDetector.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "KernelLogDetector.hpp"
#include <brcmprobe-core/util/StringUtils.h>

#define KernelLogExcerptLines 5

using namespace std;
using namespace brcmprobe;

vector<string> KernelLogDetector::vendorLines(const string &log) {
    vector<string> lines;
    for (const string &line : StringUtils::split_lines(log)) {
        if (StringUtils::contains_ignore_case(line, "brcm") ||
            StringUtils::contains_ignore_case(line, "broadcom")) {
            lines.push_back(line);
        }
    }
    return lines;
}

bool KernelLogDetector::tryDetect(HostProbe &probe, DeviceSignature &signature, DetectionAttempt &attempt, DetectionResult &resultOut) {
    attempt.title = "Broadcom WiFi in Kernel Log";
    
    string log;
    if (!probe.kernelLog || !probe.kernelLog->readLog(log)) {
        attempt.plain("kernel log not readable");
        return false;
    }
    
    vector<string> lines = vendorLines(log);
    if (lines.empty()) {
        attempt.plain("no Broadcom references in kernel log");
        return false;
    }
    attempt.sourcePresent = true;
    signature.capture(SignatureKindKernelLog, StringUtils::join(lines, "\n"));
    
    // fragment priority wins over line order
    for (const CatalogMatcher &matcher : catalog->matchersForTable(CatalogTableChipFragment)) {
        for (const string &line : lines) {
            if (!matcher.matches(line)) {
                continue;
            }
            const ChipProfile *profile = catalog->profileForChip(matcher.chipId);
            if (!profile) {
                continue;
            }
            attempt.success("Chip: " + profile->chipId + " (likely)");
            attempt.plain("  " + StringUtils::trim(line));
            resultOut.strategyId = identifier;
            resultOut.confidence = ConfidenceLikely;
            resultOut.chips = {profile};
            resultOut.evidence = StringUtils::trim(line);
            return true;
        }
    }
    
    attempt.warning("Could not determine exact chip model");
    attempt.info("kernel log excerpt:");
    for (size_t i = 0; i < lines.size() && i < KernelLogExcerptLines; i++) {
        attempt.plain("  " + StringUtils::trim(lines[i]));
    }
    return false;
}
