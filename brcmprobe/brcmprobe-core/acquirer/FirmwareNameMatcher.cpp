//
//  FirmwareNameMatcher.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "FirmwareNameMatcher.hpp"
#include <fnmatch.h>

using namespace std;
using namespace brcmprobe;

const vector<string>& FirmwareNameMatcher::patterns() {
    static const vector<string> firmwarePatterns{
        "fw_bcm*.bin",
        "brcmfmac*.bin"
    };
    return firmwarePatterns;
}

bool FirmwareNameMatcher::matches(const string &fileName) {
    for (const string &pattern : patterns()) {
        if (fnmatch(pattern.c_str(), fileName.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}
