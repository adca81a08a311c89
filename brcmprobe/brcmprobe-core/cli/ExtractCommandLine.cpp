//
//  ExtractCommandLine.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "ExtractCommandLine.hpp"
#include <cstdio>

using namespace std;
using namespace brcmprobe;

ExtractCommandLine::ExtractCommandLine(): CommandLine("brcmprobe-extract", "extract broadcom wifi firmware into the patch tree", {
    {{"-s", "--source"}, "source: adb, a directory, or image:<path>", true},
    {{"-c", "--chip"}, "chip model (e.g., bcm43455c0)", true},
    {{"-v", "--version"}, "firmware version (e.g., 7_45_206)", true},
    {{"-o", "--output"}, "output root (default: <root>/firmwares)", true},
    {{"--detect"}, "fill a missing chip or version by detecting this host", false},
    {{"-r", "--report"}, "write a JSON report of the extraction", true},
    {{"-d", "--data"}, "extra data, e.g. root=/opt/nexmon;adb=/usr/bin/adb", true},
    {{"-h", "--help"}, "show this help message", false}
}) {}

bp_return_t ExtractCommandLine::parse(int argc, const char *argv[], string &errorOut) {
    bp_return_t ret = parseCommon(argc, argv, errorOut);
    if (ret != BP_SUCCESS || helpRequested) {
        return ret;
    }
    
    request.sourceDescriptor = valueOf("source");
    request.chipId = valueOf("chip");
    request.versionId = valueOf("version");
    request.outputRoot = valueOf("output");
    request.detect = parser.exists("detect");
    
    bool targetMissing = request.chipId.empty() || request.versionId.empty();
    if (request.sourceDescriptor.empty() || (targetMissing && !request.detect)) {
        errorOut = "Missing required arguments";
        return BP_INVALID_ARGUMENTS;
    }
    return BP_SUCCESS;
}

void ExtractCommandLine::printUsage() {
    CommandLine::printUsage();
    printf("\n");
    printf("EXAMPLES:\n");
    printf("    # Extract from connected Android device\n");
    printf("    %s --source adb --chip bcm4339 --version 6_37_34_43\n\n", bin.c_str());
    printf("    # Extract from Raspberry Pi\n");
    printf("    %s --source /lib/firmware/brcm --chip bcm43455c0 --version 7_45_206\n\n", bin.c_str());
    printf("    # Extract from a mounted system image\n");
    printf("    %s --source image:/mnt/system --chip bcm4358 --version 7_112_300_14_sta\n\n", bin.c_str());
    printf("    # Let detection pick chip and version\n");
    printf("    %s --source /lib/firmware/brcm --detect\n", bin.c_str());
}
