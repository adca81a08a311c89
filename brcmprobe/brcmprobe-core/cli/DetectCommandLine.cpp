//
//  DetectCommandLine.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "DetectCommandLine.hpp"

using namespace std;
using namespace brcmprobe;

DetectCommandLine::DetectCommandLine(): CommandLine("brcmprobe-detect", "detect the broadcom wifi chip of this host", {
    {{"-r", "--report"}, "write a JSON report of the detection", true},
    {{"-d", "--data"}, "extra data, e.g. devicetree=/tmp/model;fwdirs=/lib/firmware/brcm", true},
    {{"-h", "--help"}, "show this help message", false}
}) {}

bp_return_t DetectCommandLine::parse(int argc, const char *argv[], string &errorOut) {
    return parseCommon(argc, argv, errorOut);
}
