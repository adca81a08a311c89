//
//  TestExtractionPipeline.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "TestExtractionPipeline.hpp"
#include "fakes/FakeBridgeTool.hpp"
#include "fakes/FakeHostProbe.hpp"
#include <brcmprobe-core/pipeline/ExtractionPipeline.hpp>
#include <brcmprobe-core/serialization/ResultSerializationManager.hpp>
#include <brcmprobe-core/util/StringUtils.h>
#include <rapidjson/document.h>

#include <cstdio>
#include <filesystem>

using namespace std;
using namespace brcmprobe;
namespace fs = std::filesystem;

static ProbeConfig testConfig(const string &workDir) {
    ProbeConfig config;
    config.rootDir = workDir;
    config.stagingDir = StringUtils::path_join(workDir, "staging/");
    return config;
}

static bool directoryIsEmpty(const string &dir) {
    error_code ec;
    return fs::is_directory(dir, ec) && fs::directory_iterator(dir, ec) == fs::directory_iterator();
}

static bool testEndToEnd(const string &workDir) {
    bool success = true;
    string fwDir = StringUtils::path_join(workDir, "fw");
    string outDir = StringUtils::path_join(workDir, "out");
    fs::create_directories(fwDir);
    fs::create_directories(outDir);
    Tester::writeTextFile(StringUtils::path_join(fwDir, "fw_bcm43455c0.bin"), "FIRMWARE");
    
    ExtractionRequest request;
    request.sourceDescriptor = fwDir;
    request.chipId = "bcm43455c0";
    request.versionId = "7_45_206";
    request.outputRoot = outDir;
    
    ExtractionPipeline pipeline(testConfig(workDir));
    ExtractionResult result = pipeline.run(request);
    string target = StringUtils::path_join(outDir, "bcm43455c0/7_45_206");
    error_code ec;
    success &= Tester::check(result.status == ExtractionStatusSuccess && result.code == BP_SUCCESS && result.failedStep.empty(), "extraction reports Success");
    success &= Tester::check(fs::exists(StringUtils::path_join(target, "fw_bcm43455c0.bin"), ec) &&
                             fs::exists(StringUtils::path_join(target, "definitions.mk"), ec) &&
                             fs::exists(StringUtils::path_join(target, "Makefile"), ec), "binary, definitions.mk and Makefile exist");
    success &= Tester::check(!pipeline.ranDetection, "explicit chip and version skip detection");
    
    // the report parses back with the same status and files
    rapidjson::Document d;
    d.Parse(ResultSerializationManager::extractionReportJSON(result, nullptr).c_str());
    bool reportMatches = !d.HasParseError() && d.HasMember("extraction") && !d.HasMember("detection");
    if (reportMatches) {
        const rapidjson::Value &extraction = d["extraction"];
        reportMatches = string(extraction["status"].GetString()) == "Success" &&
                        string(extraction["chip"].GetString()) == "bcm43455c0" &&
                        string(extraction["firmware_version"].GetString()) == "7_45_206" &&
                        extraction["files_written"].Size() == result.filesWritten.size();
        for (rapidjson::SizeType i = 0; reportMatches && i < extraction["files_written"].Size(); i++) {
            reportMatches = extraction["files_written"][i].GetString() == result.filesWritten[i];
        }
    }
    success &= Tester::check(reportMatches, "JSON extraction report round-trips status and files");
    
    string reportPath = StringUtils::path_join(workDir, "report.json");
    success &= Tester::check(ResultSerializationManager::storeExtractionReport(reportPath, result, nullptr) &&
                             Tester::readTextFile(reportPath).find("\"status\":\"Success\"") != string::npos, "report file is written");
    
    // same invocation against an empty source
    string emptyFw = StringUtils::path_join(workDir, "fw-empty");
    string emptyOut = StringUtils::path_join(workDir, "out-empty");
    fs::create_directories(emptyFw);
    fs::create_directories(emptyOut);
    request.sourceDescriptor = emptyFw;
    request.outputRoot = emptyOut;
    result = pipeline.run(request);
    success &= Tester::check(!result.succeeded() && result.status == ExtractionStatusNotFound &&
                             result.code == BP_NO_FILES_FOUND && result.failedStep == BP_STEP_ACQUISITION, "empty source fails in acquisition");
    success &= Tester::check(directoryIsEmpty(emptyOut), "nothing is created under the output root");
    
    request.sourceDescriptor = StringUtils::path_join(workDir, "no-such-dir");
    result = pipeline.run(request);
    success &= Tester::check(result.code == BP_SOURCE_UNAVAILABLE && result.failedStep == BP_STEP_ACQUISITION &&
                             result.diagnostic.find("no-such-dir") != string::npos, "missing source path names the path");
    return success;
}

static bool testArguments(const string &workDir) {
    bool success = true;
    ExtractionPipeline pipeline(testConfig(workDir));
    
    ExtractionRequest request;
    request.sourceDescriptor = StringUtils::path_join(workDir, "fw");
    request.chipId = "bcm43455c0";
    ExtractionResult result = pipeline.run(request);
    success &= Tester::check(result.code == BP_INVALID_ARGUMENTS && result.failedStep == BP_STEP_ARGUMENTS &&
                             result.diagnostic == "Missing required arguments", "missing version is a usage error");
    
    request.versionId = "7_45_206";
    request.chipId = "Broadcom!";
    result = pipeline.run(request);
    success &= Tester::check(result.code == BP_INVALID_ARGUMENTS && result.failedStep == BP_STEP_ARGUMENTS, "malformed chip id is a usage error");
    
    request.chipId = "bcm43455c0";
    request.versionId = "../escape";
    result = pipeline.run(request);
    success &= Tester::check(result.code == BP_INVALID_ARGUMENTS, "version with a path separator is rejected");
    
    // unknown chip is allowed with a warning, and the default output root is used
    request.chipId = "bcm4375b1";
    request.versionId = "18_41_8_9";
    request.outputRoot = "";
    Tester::writeTextFile(StringUtils::path_join(workDir, "fw/fw_bcm4375b1.bin"), "NEW");
    result = pipeline.run(request);
    success &= Tester::check(result.succeeded() && !result.warnings.empty() &&
                             result.outputDir == StringUtils::path_join(workDir, "firmwares/bcm4375b1/18_41_8_9"),
                             "uncatalogued chip extracts into <root>/firmwares with a warning");
    return success;
}

static bool testBinarySelection() {
    bool success = true;
    vector<AcquiredBinary> binaries(3);
    binaries[0].filename = "brcmfmac43430-sdio.bin";
    binaries[1].filename = "brcmfmac43455-sdio.bin";
    binaries[2].filename = "fw_bcm43455c0.bin";
    
    const AcquiredBinary *selected = ExtractionPipeline::selectBinary(binaries, "bcm43455c0");
    success &= Tester::check(selected == &binaries[1], "first file carrying the chip number is selected");
    selected = ExtractionPipeline::selectBinary(binaries, "bcm4339");
    success &= Tester::check(selected == &binaries[0], "falls back to the first file");
    success &= Tester::check(ExtractionPipeline::selectBinary({}, "bcm4339") == nullptr, "nothing to select from an empty list");
    return success;
}

static bool testDetectMode(const string &workDir) {
    bool success = true;
    string fwDir = StringUtils::path_join(workDir, "fw-detect");
    fs::create_directories(fwDir);
    Tester::writeTextFile(StringUtils::path_join(fwDir, "brcmfmac43455-sdio.bin"), "PI");
    Tester::writeTextFile(StringUtils::path_join(fwDir, "brcmfmac43430-sdio.bin"), "ZERO");
    
    shared_ptr<FakeHostProbe> pi = make_shared<FakeHostProbe>();
    pi->withDeviceTree("Raspberry Pi 4 Model B Rev 1.4");
    ExtractionPipeline pipeline(testConfig(workDir), pi);
    
    ExtractionRequest request;
    request.sourceDescriptor = fwDir;
    request.outputRoot = StringUtils::path_join(workDir, "out-detect");
    request.detect = true;
    ExtractionResult result = pipeline.run(request);
    success &= Tester::check(result.succeeded() && pipeline.ranDetection &&
                             result.chipId == "bcm43455c0" && result.versionId == "7_45_206", "--detect fills chip and best-ranked version");
    success &= Tester::check(!result.filesWritten.empty() &&
                             result.filesWritten[0] == "brcmfmac43455-sdio.bin", "detected chip selects its own binary");
    
    rapidjson::Document d;
    d.Parse(ResultSerializationManager::extractionReportJSON(result, &pipeline.detection).c_str());
    success &= Tester::check(!d.HasParseError() && d["detection"]["detected"].GetBool() &&
                             string(d["detection"]["result"]["strategy"].GetString()) == "device-tree", "extraction report embeds the detection");
    
    // explicit chip, version from the catalog
    ExtractionPipeline chipOnly(testConfig(workDir), make_shared<FakeHostProbe>());
    request.chipId = "bcm43430a1";
    result = chipOnly.run(request);
    success &= Tester::check(result.succeeded() && !chipOnly.ranDetection && result.versionId == "7_45_41_46", "--detect with a chip only picks its recommended version");
    
    // two chip families on the host cannot be resolved automatically
    shared_ptr<FakeHostProbe> twoChips = make_shared<FakeHostProbe>();
    twoChips->withFirmwareTree({{"/lib/firmware/brcm", {"/lib/firmware/brcm/brcmfmac43430-sdio.bin", "/lib/firmware/brcm/brcmfmac43455-sdio.bin"}}});
    ExtractionPipeline ambiguous(testConfig(workDir), twoChips);
    request.chipId = "";
    request.versionId = "";
    result = ambiguous.run(request);
    success &= Tester::check(!result.succeeded() && result.code == BP_INVALID_ARGUMENTS && result.failedStep == BP_STEP_ARGUMENTS,
                             "ambiguous detection is a usage error");
    
    ExtractionPipeline inconclusive(testConfig(workDir), make_shared<FakeHostProbe>());
    result = inconclusive.run(request);
    success &= Tester::check(result.code == BP_DETECTION_INCONCLUSIVE && result.failedStep == BP_STEP_ARGUMENTS, "inconclusive detection is reported");
    return success;
}

static bool testBridgeExtraction(const string &workDir) {
    bool success = true;
    shared_ptr<FakeBridgeTool> bridge = make_shared<FakeBridgeTool>();
    bridge->remoteTree["/vendor/firmware"] = {"fw_bcm4339.bin", "fw_bcm4339_apsta.bin"};
    bridge->brokenFiles = {"fw_bcm4339_apsta.bin"};
    ExtractionPipeline pipeline(testConfig(workDir), nullptr, bridge);
    
    ExtractionRequest request;
    request.sourceDescriptor = "adb";
    request.chipId = "bcm4339";
    request.versionId = "6_37_34_43";
    request.outputRoot = StringUtils::path_join(workDir, "out-adb");
    ExtractionResult result = pipeline.run(request);
    
    bool warned = false;
    for (const string &warning : result.warnings) {
        warned |= warning.find("fw_bcm4339_apsta.bin") != string::npos;
    }
    success &= Tester::check(result.succeeded() && warned &&
                             Tester::readTextFile(StringUtils::path_join(result.outputDir, result.filesWritten[0])) == "firmware:/vendor/firmware/fw_bcm4339.bin",
                             "partial bridge transfer succeeds with a warning");
    return success;
}

bool TestExtractionPipeline::start() {
    printf("[*] Test extraction pipeline\n");
    string workDir = createTempDir();
    if (workDir.empty()) {
        return check(false, "cannot create temp dir");
    }
    
    bool success = true;
    success &= testEndToEnd(workDir);
    success &= testArguments(workDir);
    success &= testBinarySelection();
    success &= testDetectMode(workDir);
    success &= testBridgeExtraction(workDir);
    
    error_code ec;
    fs::remove_all(workDir, ec);
    return success;
}
