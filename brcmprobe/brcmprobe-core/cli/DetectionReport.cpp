//
//  DetectionReport.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "DetectionReport.hpp"
#include <brcmprobe-core/util/StringUtils.h>

using namespace std;
using namespace brcmprobe;

static string prefixed(const LogEntry &entry) {
    switch (entry.level) {
        case LogLevelInfo:
            return "[*] " + entry.content;
        case LogLevelSuccess:
            return "[+] " + entry.content;
        case LogLevelWarning:
            return "[!] " + entry.content;
        case LogLevelError:
            return "[-] " + entry.content;
        default:
            return entry.content;
    }
}

vector<LogEntry> DetectionReport::renderAttempt(const DetectionAttempt &attempt) {
    vector<LogEntry> lines;
    lines.push_back({LogLevelPlain, ""});
    lines.push_back({LogLevelInfo, attempt.title + ":"});
    for (const LogEntry &entry : attempt.lines) {
        lines.push_back({entry.level, prefixed(entry)});
    }
    return lines;
}

vector<LogEntry> DetectionReport::renderRecommendations(const DetectionResult &result) {
    vector<LogEntry> lines;
    bool likely = result.confidence == ConfidenceLikely;
    lines.push_back({LogLevelPlain, ""});
    lines.push_back({LogLevelInfo, "[*] Recommended firmware patches:"});
    
    for (const ChipProfile *profile : result.chips) {
        string chipLine = "[+] " + profile->chipId + " - " + profile->displayName;
        if (likely) {
            chipLine += " (likely)";
        }
        lines.push_back({LogLevelSuccess, chipLine});
        for (const FirmwareCandidate &candidate : profile->rankedCandidates()) {
            string line = "  • " + candidate.relativePatchPath;
            if (!candidate.note.empty()) {
                line += " (" + candidate.note + ")";
            }
            lines.push_back({LogLevelPlain, line});
        }
    }
    
    if (likely) {
        lines.push_back({LogLevelWarning, StringUtils::format("[!] Best-effort guess from %s, verify the chip before flashing a patch", result.strategyId.c_str())});
    }
    if (result.isAmbiguous()) {
        lines.push_back({LogLevelWarning, "[!] Several chip families found, pick the one matching your WiFi interface"});
    }
    return lines;
}

vector<LogEntry> DetectionReport::renderManualSteps() {
    return {
        {LogLevelPlain, ""},
        {LogLevelWarning, "Could not automatically detect device"},
        {LogLevelPlain, ""},
        {LogLevelInfo, "[*] Manual detection steps:"},
        {LogLevelPlain, "  1. Check dmesg: dmesg | grep -i brcm"},
        {LogLevelPlain, "  2. Check firmware: ls /lib/firmware/brcm/"},
        {LogLevelPlain, "  3. Check lspci: lspci | grep -i network"},
        {LogLevelPlain, "  4. See COMPATIBILITY.md for full device list"},
    };
}

vector<LogEntry> DetectionReport::renderNextSteps() {
    return {
        {LogLevelPlain, ""},
        {LogLevelSuccess, "Next Steps:"},
        {LogLevelPlain, "1. Navigate to the recommended patch directory"},
        {LogLevelPlain, "2. Run: source setup_env.sh"},
        {LogLevelPlain, "3. Run: make"},
        {LogLevelPlain, "4. Run: make install-firmware"},
    };
}

vector<LogEntry> DetectionReport::render(const DetectionOutcome &outcome) {
    vector<LogEntry> lines;
    for (const DetectionAttempt &attempt : outcome.attempts) {
        vector<LogEntry> section = renderAttempt(attempt);
        lines.insert(lines.end(), section.begin(), section.end());
    }
    
    vector<LogEntry> tail;
    if (outcome.detected) {
        tail = renderRecommendations(outcome.result);
        vector<LogEntry> next = renderNextSteps();
        tail.insert(tail.end(), next.begin(), next.end());
    } else {
        tail = renderManualSteps();
    }
    lines.insert(lines.end(), tail.begin(), tail.end());
    return lines;
}
