//
//  ExtractionPipeline.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "ExtractionPipeline.hpp"
#include <brcmprobe-core/catalog/ChipCatalog.hpp>
#include <brcmprobe-core/log/buffered_logger.hpp>
#include <brcmprobe-core/scaffold/StructureScaffolder.hpp>
#include <brcmprobe-core/util/StringUtils.h>

using namespace std;
using namespace brcmprobe;

ExtractionPipeline::ExtractionPipeline(const ProbeConfig &config, shared_ptr<HostProbe> probe, shared_ptr<BridgeTool> bridge, shared_ptr<ImageMounter> mounter):
    ranDetection(false),
    config(config),
    probe(probe),
    bridge(bridge),
    mounter(mounter)
{}

const AcquiredBinary* ExtractionPipeline::selectBinary(const vector<AcquiredBinary> &binaries, const string &chipId) {
    if (binaries.empty()) {
        return nullptr;
    }
    
    string chipNumber = ChipProfile::chipNumberFromId(chipId);
    if (!chipNumber.empty()) {
        for (const AcquiredBinary &binary : binaries) {
            if (binary.filename.find(chipNumber) != string::npos) {
                return &binary;
            }
        }
    }
    return &binaries[0];
}

bool ExtractionPipeline::resolveTarget(ExtractionRequest &request, ExtractionResult &result) {
    BufferedLogger *logger = BufferedLogger::globalLogger();
    ChipCatalog *catalog = ChipCatalog::sharedCatalog();
    
    if (request.chipId.empty()) {
        if (!probe) {
            probe = HostProbe::systemProbe(config);
        }
        logger->info("Detecting chip...");
        DetectorDispatcher dispatcher;
        ranDetection = true;
        if (!dispatcher.detect(*probe, detection)) {
            result.fail(ExtractionStatusNotFound, BP_DETECTION_INCONCLUSIVE, BP_STEP_ARGUMENTS,
                        "Could not detect the chip, pass --chip and --version explicitly");
            return false;
        }
        
        if (detection.result.isAmbiguous()) {
            vector<string> chipIds;
            for (const ChipProfile *profile : detection.result.chips) {
                chipIds.push_back(profile->chipId);
            }
            result.fail(ExtractionStatusNotFound, BP_INVALID_ARGUMENTS, BP_STEP_ARGUMENTS,
                        "Detection found several chips (" + StringUtils::join(chipIds, ", ") + "), pass --chip explicitly");
            return false;
        }
        
        request.chipId = detection.result.chips[0]->chipId;
        if (detection.result.confidence == ConfidenceLikely) {
            result.warnings.push_back("chip " + request.chipId + " was guessed by " + detection.result.strategyId + ", verify it before patching");
        }
        logger->success("Using detected chip " + request.chipId);
    }
    
    if (request.versionId.empty()) {
        const ChipProfile *profile = catalog->profileForChip(request.chipId);
        if (!profile || profile->candidateFirmwareVersions.empty()) {
            result.fail(ExtractionStatusNotFound, BP_INVALID_ARGUMENTS, BP_STEP_ARGUMENTS,
                        "No known firmware version for " + request.chipId + ", pass --version explicitly");
            return false;
        }
        request.versionId = profile->rankedCandidates()[0].versionId;
        logger->success("Using recommended firmware version " + request.versionId);
    }
    return true;
}

bool ExtractionPipeline::validateRequest(const ExtractionRequest &request, ExtractionResult &result) {
    if (request.sourceDescriptor.empty() || request.chipId.empty() || request.versionId.empty()) {
        result.fail(ExtractionStatusNotFound, BP_INVALID_ARGUMENTS, BP_STEP_ARGUMENTS, "Missing required arguments");
        return false;
    }
    
    if (!ChipCatalog::isValidChipId(request.chipId)) {
        result.fail(ExtractionStatusNotFound, BP_INVALID_ARGUMENTS, BP_STEP_ARGUMENTS,
                    "Invalid chip id " + request.chipId + ", expected something like bcm43455c0");
        return false;
    }
    
    // the version becomes a directory name
    if (request.versionId.find('/') != string::npos || request.versionId == "." || request.versionId == "..") {
        result.fail(ExtractionStatusNotFound, BP_INVALID_ARGUMENTS, BP_STEP_ARGUMENTS,
                    "Invalid firmware version " + request.versionId);
        return false;
    }
    
    const ChipProfile *profile = ChipCatalog::sharedCatalog()->profileForChip(request.chipId);
    if (!profile) {
        result.warnings.push_back(request.chipId + " is not a known chip, no patch profile matches it yet");
    } else if (!profile->candidateForVersion(request.versionId)) {
        result.warnings.push_back("firmware " + request.versionId + " is not a known version of " + request.chipId);
    }
    return true;
}

ExtractionResult ExtractionPipeline::run(const ExtractionRequest &originalRequest) {
    BufferedLogger *logger = BufferedLogger::globalLogger();
    ExtractionRequest request = originalRequest;
    ExtractionResult result;
    result.source = request.sourceDescriptor;
    
    if (request.detect && (request.chipId.empty() || request.versionId.empty())) {
        if (!resolveTarget(request, result)) {
            logger->error(result.diagnostic);
            return result;
        }
    }
    result.chipId = request.chipId;
    result.versionId = request.versionId;
    
    if (!validateRequest(request, result)) {
        logger->error(result.diagnostic);
        return result;
    }
    
    string outputRoot = request.outputRoot.empty() ? config.defaultOutputRoot() : request.outputRoot;
    result.outputDir = StructureScaffolder::targetDirectory(outputRoot, request.chipId, request.versionId);
    
    FirmwareSource source = FirmwareSource::parse(request.sourceDescriptor);
    logger->info("Source: " + source.description());
    logger->info("Chip: " + request.chipId);
    logger->info("Version: " + request.versionId);
    logger->info("Output: " + result.outputDir);
    
    AcquirerDispatcher acquirers(config, bridge, mounter);
    vector<AcquiredBinary> binaries;
    bp_return_t ret = acquirers.start(source, request.chipId, request.versionId, binaries);
    switch (ret) {
        case BP_SUCCESS:
            break;
        case BP_PARTIAL_TRANSFER:
            for (const string &name : acquirers.lastTransferFailures) {
                result.warnings.push_back("could not transfer " + name);
            }
            break;
        case BP_SOURCE_UNAVAILABLE:
            result.fail(ExtractionStatusNotFound, ret, BP_STEP_ACQUISITION,
                        "Source " + source.description() + " is not available");
            break;
        case BP_NO_FILES_FOUND:
            result.fail(ExtractionStatusNotFound, ret, BP_STEP_ACQUISITION,
                        "No firmware files (fw_bcm*.bin, brcmfmac*.bin) found in " + source.description());
            break;
        default:
            result.fail(ExtractionStatusNotFound, ret, BP_STEP_ACQUISITION,
                        "Every firmware transfer from " + source.description() + " failed");
            break;
    }
    if (!result.failedStep.empty()) {
        logger->error(result.diagnostic);
        return result;
    }
    
    const AcquiredBinary *binary = selectBinary(binaries, request.chipId);
    if (binaries.size() > 1) {
        vector<string> others;
        for (const AcquiredBinary &acquired : binaries) {
            if (&acquired != binary) {
                others.push_back(acquired.filename);
            }
        }
        logger->info("Selected " + binary->filename + ", also acquired: " + StringUtils::join(others, ", "));
    }
    
    StructureScaffolder scaffolder;
    ExtractionResult scaffolded = scaffolder.scaffold(request.chipId, request.versionId, *binary, outputRoot);
    scaffolded.source = result.source;
    scaffolded.warnings.insert(scaffolded.warnings.begin(), result.warnings.begin(), result.warnings.end());
    if (scaffolded.succeeded()) {
        logger->success("Firmware extraction complete!");
    }
    return scaffolded;
}
