//
//  main.cpp
//  brcmprobe-extract
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include <cstdio>
#include <iostream>
#include <termcolor/termcolor.hpp>
#include <brcmprobe-core/cli/ExtractCommandLine.hpp>
#include <brcmprobe-core/config/ProbeConfig.hpp>
#include <brcmprobe-core/pipeline/ExtractionPipeline.hpp>
#include <brcmprobe-core/serialization/ResultSerializationManager.hpp>
#include <brcmprobe-core/util/StringUtils.h>

using namespace std;
using namespace brcmprobe;

int main(int argc, const char *argv[]) {
    // hello text
    printf("\n");
    printf("[***] brcmprobe Automated Firmware Extraction 0.1\n");
    printf("[***] pulls broadcom wifi firmware into the nexmon firmwares/ tree\n");
    printf("\n");
    
    // parse args
    ExtractCommandLine commandLine;
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
        commandLine.printUsage();
        return 1;
    }
    
    BufferedLogger *logger = BufferedLogger::globalLogger();
    logger->stopBuffer();
    
    ExtractionPipeline *pipeline = new ExtractionPipeline(config);
    ExtractionResult result = pipeline->run(commandLine.request);
    if (!commandLine.reportPath.empty()) {
        const DetectionOutcome *detection = pipeline->ranDetection ? &pipeline->detection : nullptr;
        if (ResultSerializationManager::storeExtractionReport(commandLine.reportPath, result, detection)) {
            logger->info("report saved to " + commandLine.reportPath);
        } else {
            logger->warning("cannot save report to " + commandLine.reportPath);
        }
    }
    delete pipeline;
    
    for (const string &warning : result.warnings) {
        logger->warning(warning);
    }
    
    if (!result.succeeded()) {
        printf("\n");
        cout << termcolor::red;
        cout << StringUtils::format("[-] %s failed (%s): %s", result.failedStep.c_str(), bp_return_desc(result.code), result.diagnostic.c_str());
        cout << termcolor::reset << endl;
        if (result.failedStep == BP_STEP_ARGUMENTS) {
            commandLine.printUsage();
        }
        return 1;
    }
    
    printf("\n");
    logger->info("Files written:");
    for (const string &file : result.filesWritten) {
        logger->append("  • " + StringUtils::path_join(result.outputDir, file));
    }
    
    printf("\n");
    logger->info("Next steps:");
    logger->append("  1. Analyze firmware with IDA Pro/Ghidra/radare2");
    logger->append("  2. Update addresses in " + result.outputDir + "/definitions.mk");
    logger->append("  3. Extract flashpatches: cd " + result.outputDir + " && make");
    logger->append("  4. Create patch structure in patches/" + result.chipId + "/" + result.versionId + "/");
    return 0;
}
