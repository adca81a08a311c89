//
//  FilesystemAcquirer.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "FilesystemAcquirer.hpp"
#include "FirmwareNameMatcher.hpp"
#include <brcmprobe-core/util/StringUtils.h>
#include <algorithm>
#include <filesystem>

using namespace std;
using namespace brcmprobe;
namespace fs = std::filesystem;

vector<string> FilesystemAcquirer::scanFirmwareFiles(const string &rootDir) {
    vector<string> files;
    error_code ec;
    fs::recursive_directory_iterator it(rootDir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return files;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        error_code statError;
        if (!it->is_regular_file(statError)) {
            continue;
        }
        if (FirmwareNameMatcher::matches(it->path().filename().string())) {
            files.push_back(it->path().string());
        }
    }
    
    sort(files.begin(), files.end(), [](const string &a, const string &b) {
        string nameA = fs::path(a).filename().string();
        string nameB = fs::path(b).filename().string();
        if (nameA != nameB) {
            return nameA < nameB;
        }
        return a < b;
    });
    return files;
}

bp_return_t FilesystemAcquirer::acquire(const FirmwareSource &source, vector<AcquiredBinary> &binariesOut) {
    BufferedLogger *logger = BufferedLogger::globalLogger();
    logger->info("Extracting firmware from filesystem: " + source.path);
    
    error_code ec;
    if (source.path.empty() || !fs::is_directory(source.path, ec)) {
        logger->error("Source directory not found: " + source.path);
        return BP_SOURCE_UNAVAILABLE;
    }
    return acquireFromDirectory(source.path, binariesOut);
}

bp_return_t FilesystemAcquirer::acquireFromDirectory(const string &rootDir, vector<AcquiredBinary> &binariesOut) {
    BufferedLogger *logger = BufferedLogger::globalLogger();
    vector<string> files = scanFirmwareFiles(rootDir);
    if (files.empty()) {
        logger->warning("No firmware files found in " + rootDir);
        return BP_NO_FILES_FOUND;
    }
    
    if (!staging || staging->resetWorkDir() != 0) {
        logger->error("cannot prepare staging area");
        return BP_TRANSFER_FAILED;
    }
    
    logger->success("Found firmware files:");
    for (const string &file : files) {
        string fileName = StringUtils::last_path_component(file);
        logger->append("  • " + fileName);
        
        string stagedPath;
        AcquiredBinary binary;
        if (staging->createShadowFile(file, stagedPath) != 0 ||
            !AcquiredBinary::loadFromFile(stagedPath, binary.bytes)) {
            logger->warning("cannot copy " + file);
            transferFailures.push_back(fileName);
            continue;
        }
        binary.filename = fileName;
        binary.originPath = file;
        binariesOut.push_back(binary);
    }
    sortBinaries(binariesOut);
    
    if (binariesOut.empty()) {
        return BP_TRANSFER_FAILED;
    }
    if (!transferFailures.empty()) {
        return BP_PARTIAL_TRANSFER;
    }
    return BP_SUCCESS;
}
