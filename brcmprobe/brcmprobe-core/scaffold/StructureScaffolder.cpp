//
//  StructureScaffolder.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "StructureScaffolder.hpp"
#include <brcmprobe-core/log/buffered_logger.hpp>
#include <brcmprobe-core/util/StringUtils.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

using namespace std;
using namespace brcmprobe;
namespace fs = std::filesystem;

string StructureScaffolder::targetDirectory(const string &outputRoot, const string &chipId, const string &versionId) {
    return StringUtils::path_join(StringUtils::path_join(outputRoot, chipId), versionId);
}

string StructureScaffolder::definitionsTemplate(const string &chipId, const string &versionId) {
    // nexmon tags look like CHIP_VER_BCM43455c0 and FW_VER_7_45_206
    string chipTag = "CHIP_VER_BCM";
    if (StringUtils::has_prefix(chipId, "bcm")) {
        chipTag += chipId.substr(3);
    } else {
        chipTag += chipId;
    }
    
    string content;
    content += "# Firmware definitions for " + chipId + " " + versionId + "\n";
    content += "# TODO: Update these addresses based on firmware analysis\n";
    content += "\n";
    content += "NEXMON_CHIP=" + chipTag + "\n";
    content += "NEXMON_CHIP_NUM=0x\n";
    content += "NEXMON_FW_VERSION=FW_VER_" + versionId + "\n";
    content += "\n";
    content += "# RAM addresses (update based on firmware analysis)\n";
    content += "RAMSTART=0x\n";
    content += "RAMSIZE=0x\n";
    content += "\n";
    content += "# Function addresses (update based on firmware analysis)\n";
    content += "# Use IDA Pro, Ghidra, or radare2 to find these\n";
    content += "WLC_UCODE_WRITE_BL_HOOK_ADDR=0x\n";
    content += "HNDRTE_RECLAIM_0_END_PTR=0x\n";
    content += "\n";
    content += "# Template RAM\n";
    content += "TEMPLATERAMSTART_PTR=0x\n";
    content += "\n";
    content += "# Add more addresses as needed\n";
    return content;
}

string StructureScaffolder::makefileTemplate() {
    return "include definitions.mk\n"
           "include $(NEXMON_ROOT)/firmwares/common.mk\n";
}

bool StructureScaffolder::writeFile(const string &path, const char *data, size_t size, string &errorOut) {
    ofstream out(path, ios::binary | ios::trunc);
    if (!out.is_open()) {
        errorOut = StringUtils::format("cannot open %s for writing: %s", path.c_str(), strerror(errno));
        return false;
    }
    out.write(data, size);
    out.close();
    if (out.fail()) {
        errorOut = StringUtils::format("cannot write %s", path.c_str());
        return false;
    }
    return true;
}

ExtractionResult StructureScaffolder::scaffold(const string &chipId, const string &versionId, const AcquiredBinary &binary, const string &outputRoot) {
    BufferedLogger *logger = BufferedLogger::globalLogger();
    ExtractionResult result;
    result.chipId = chipId;
    result.versionId = versionId;
    result.outputDir = targetDirectory(outputRoot, chipId, versionId);
    
    error_code ec;
    fs::create_directories(result.outputDir, ec);
    if (ec) {
        result.fail(ExtractionStatusPartialFailure, BP_SCAFFOLD_ERROR, BP_STEP_SCAFFOLD,
                    StringUtils::format("cannot create %s: %s", result.outputDir.c_str(), ec.message().c_str()));
        logger->error(result.diagnostic);
        return result;
    }
    
    // binary, last write wins
    string binaryPath = StringUtils::path_join(result.outputDir, binary.filename);
    if (fs::exists(binaryPath, ec)) {
        logger->warning("Replacing existing " + binaryPath);
    }
    string error;
    if (!writeFile(binaryPath, reinterpret_cast<const char *>(binary.bytes.data()), binary.bytes.size(), error)) {
        result.fail(ExtractionStatusPartialFailure, BP_SCAFFOLD_ERROR, BP_STEP_SCAFFOLD, error);
        logger->error(error);
        return result;
    }
    result.filesWritten.push_back(binary.filename);
    logger->success("Copied firmware to " + result.outputDir);
    
    string definitionsPath = StringUtils::path_join(result.outputDir, BP_DEFINITIONS_FILE);
    if (!fs::exists(definitionsPath, ec)) {
        string content = definitionsTemplate(chipId, versionId);
        if (!writeFile(definitionsPath, content.data(), content.size(), error)) {
            result.fail(ExtractionStatusPartialFailure, BP_SCAFFOLD_ERROR, BP_STEP_SCAFFOLD, error);
            logger->error(error);
            return result;
        }
        result.filesWritten.push_back("definitions.mk");
        logger->success("Created template definitions.mk");
        logger->warning("You need to update addresses in " + definitionsPath);
    } else {
        logger->info("Keeping existing " + definitionsPath);
    }
    
    string makefilePath = StringUtils::path_join(result.outputDir, BP_MAKEFILE_FILE);
    if (!fs::exists(makefilePath, ec)) {
        string content = makefileTemplate();
        if (!writeFile(makefilePath, content.data(), content.size(), error)) {
            result.fail(ExtractionStatusPartialFailure, BP_SCAFFOLD_ERROR, BP_STEP_SCAFFOLD, error);
            logger->error(error);
            return result;
        }
        result.filesWritten.push_back("Makefile");
        logger->success("Created Makefile");
    } else {
        logger->info("Keeping existing " + makefilePath);
    }
    
    result.status = ExtractionStatusSuccess;
    result.code = BP_SUCCESS;
    return result;
}
