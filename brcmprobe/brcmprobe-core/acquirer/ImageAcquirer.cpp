//
//  ImageAcquirer.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "ImageAcquirer.hpp"
#include <filesystem>

using namespace std;
using namespace brcmprobe;
namespace fs = std::filesystem;

bp_return_t ImageAcquirer::acquire(const FirmwareSource &source, vector<AcquiredBinary> &binariesOut) {
    BufferedLogger *logger = BufferedLogger::globalLogger();
    logger->info("Extracting firmware from image: " + source.path);
    
    error_code ec;
    if (source.path.empty() || !fs::exists(source.path, ec)) {
        logger->error("Image not found: " + source.path);
        return BP_SOURCE_UNAVAILABLE;
    }
    
    string imageRoot;
    bool mounted = false;
    if (fs::is_directory(source.path, ec)) {
        // already mounted or extracted
        imageRoot = source.path;
    } else if (!mounter) {
        logger->error("Cannot open raw image " + source.path + ", mount or extract it and pass the directory");
        return BP_SOURCE_UNAVAILABLE;
    } else if (!mounter->mount(source.path, imageRoot)) {
        logger->error("Failed to mount image " + source.path);
        return BP_SOURCE_UNAVAILABLE;
    } else {
        mounted = true;
    }
    
    FilesystemAcquirer scanner(identifier, desc);
    scanner.chipHint = chipHint;
    scanner.versionHint = versionHint;
    scanner.staging = staging;
    bp_return_t ret = scanner.acquireFromDirectory(imageRoot, binariesOut);
    transferFailures = scanner.transferFailures;
    
    if (mounted) {
        mounter->unmount(imageRoot);
    }
    return ret;
}
