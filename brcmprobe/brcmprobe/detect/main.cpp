//
//  main.cpp
//  brcmprobe-detect
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include <cstdio>
#include <iostream>
#include <termcolor/termcolor.hpp>
#include <brcmprobe-core/cli/DetectCommandLine.hpp>
#include <brcmprobe-core/cli/DetectionReport.hpp>
#include <brcmprobe-core/config/ProbeConfig.hpp>
#include <brcmprobe-core/detector/dispatcher/DetectorDispatcher.hpp>
#include <brcmprobe-core/serialization/ResultSerializationManager.hpp>

using namespace std;
using namespace brcmprobe;

int main(int argc, const char *argv[]) {
    // hello text
    printf("\n");
    printf("[***] brcmprobe Broadcom WiFi Device Detection 0.1\n");
    printf("[***] detects the wifi chip of this host and recommends nexmon patches\n");
    printf("\n");
    
    // parse args
    DetectCommandLine commandLine;
    string error;
    bp_return_t ret = commandLine.parse(argc, argv, error);
    if (ret != BP_SUCCESS) {
        cout << termcolor::red;
        cout << "[-] " << error;
        cout << termcolor::reset << endl;
        commandLine.printUsage();
        return 1;
    }
    
    // handle help
    if (commandLine.helpRequested) {
        commandLine.printUsage();
        return 0;
    }
    
    ProbeConfig config;
    config.applyEnvironment();
    if (config.applyOptions(commandLine.extraData, error) != BP_SUCCESS) {
        cout << termcolor::red;
        cout << "[-] Error: " << error;
        cout << termcolor::reset << endl;
        return 1;
    }
    
    shared_ptr<HostProbe> probe = HostProbe::systemProbe(config);
    DetectorDispatcher *dispatcher = new DetectorDispatcher();
    DetectionOutcome outcome;
    dispatcher->detect(*probe, outcome);
    delete dispatcher;
    
    // the chain's own trace stays out of the report
    BufferedLogger *logger = BufferedLogger::globalLogger();
    logger->purgeBuffer(0);
    logger->stopBuffer();
    for (const LogEntry &entry : DetectionReport::render(outcome)) {
        logger->append(entry.content, entry.level);
    }
    printf("\n");
    
    if (!commandLine.reportPath.empty()) {
        if (ResultSerializationManager::storeDetectionReport(commandLine.reportPath, outcome)) {
            logger->success("report saved to " + commandLine.reportPath);
        } else {
            logger->warning("cannot save report to " + commandLine.reportPath);
        }
    }
    
    // an inconclusive detection is a valid outcome
    return 0;
}
