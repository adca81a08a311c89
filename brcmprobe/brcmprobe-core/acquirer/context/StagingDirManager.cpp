//
//  StagingDirManager.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "StagingDirManager.hpp"
#include <brcmprobe-core/util/StringUtils.h>
#include <filesystem>

using namespace std;
using namespace brcmprobe;
namespace fs = std::filesystem;

// resolved path strictly below /tmp, empty when the path escapes it
static string confinedToTmp(const string &workDir) {
    if (workDir.empty() || workDir[0] != '/') {
        return "";
    }
    error_code ec;
    fs::path resolved = fs::weakly_canonical(fs::path(workDir), ec);
    if (ec) {
        return "";
    }
    string normalized = resolved.lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    if (!StringUtils::has_prefix(normalized, "/tmp/") || normalized.size() <= 5) {
        return "";
    }
    for (const fs::path &component : fs::path(normalized)) {
        if (component == "." || component == "..") {
            return "";
        }
    }
    return normalized + "/";
}

StagingDirManager::StagingDirManager(string workDir) {
    // the work dir is wiped on reset, keep it inside /tmp
    string confined = confinedToTmp(workDir);
    if (confined.empty()) {
        confined = "/tmp/brcmprobe/";
    }
    
    this->workDir = confined;
}

string StagingDirManager::getWorkDir() {
    return this->workDir;
}

int StagingDirManager::resetWorkDir() {
    if (cleanFolder() != 0) {
        return 1;
    }
    return createWorkDirIfNeeded();
}

int StagingDirManager::createWorkDirIfNeeded() {
    error_code ec;
    if (fs::is_directory(workDir, ec)) {
        return 0;
    }
    fs::create_directories(workDir, ec);
    return ec ? 1 : 0;
}

int StagingDirManager::cleanFolder() {
    error_code ec;
    if (!fs::exists(workDir, ec)) {
        return 0;
    }
    fs::remove_all(workDir, ec);
    return ec ? 1 : 0;
}

string StagingDirManager::pathForFile(string fileName) {
    return StringUtils::path_join(workDir, fileName);
}

int StagingDirManager::createShadowFile(string filePath, string &shadowPathOut /** OUT */) {
    fs::path originPath = filePath;
    fs::path shadowPath = pathForFile(originPath.filename().string());
    
    error_code ec;
    fs::copy_file(originPath, shadowPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return 1;
    }
    shadowPathOut = shadowPath.string();
    return 0;
}
