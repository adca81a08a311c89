//
//  TestFirmwareAcquirers.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "TestFirmwareAcquirers.hpp"
#include "fakes/FakeBridgeTool.hpp"
#include "fakes/FakeImageMounter.hpp"
#include <brcmprobe-core/acquirer/AcquirerDispatcher.hpp>
#include <brcmprobe-core/acquirer/FirmwareNameMatcher.hpp>
#include <brcmprobe-core/acquirer/bridge/AdbBridge.hpp>
#include <brcmprobe-core/acquirer/context/StagingDirManager.hpp>
#include <brcmprobe-core/log/buffered_logger.hpp>
#include <brcmprobe-core/util/StringUtils.h>

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

static bool testNameMatching() {
    bool success = true;
    success &= Tester::check(FirmwareNameMatcher::matches("fw_bcm43455c0.bin") &&
                             FirmwareNameMatcher::matches("brcmfmac43430-sdio.bin"), "vendor and brcmfmac names match");
    success &= Tester::check(!FirmwareNameMatcher::matches("unrelated.txt") &&
                             !FirmwareNameMatcher::matches("brcmfmac43430-sdio.txt") &&
                             !FirmwareNameMatcher::matches("fw_bcm43455c0.bin.bak"), "other names are ignored");
    
    FirmwareSource source = FirmwareSource::parse("adb");
    success &= Tester::check(source.kind == FirmwareSourceBridge, "adb selects the bridge");
    source = FirmwareSource::parse("image:/tmp/system.img");
    success &= Tester::check(source.kind == FirmwareSourceImage && source.path == "/tmp/system.img", "image: prefix selects the image source");
    source = FirmwareSource::parse("/lib/firmware/brcm");
    success &= Tester::check(source.kind == FirmwareSourceFilesystem && source.path == "/lib/firmware/brcm", "anything else is a filesystem path");
    
    vector<string> devices = AdbBridge::parseDeviceList("List of devices attached\n"
                                                        "0123456789ABCDEF\tdevice\n"
                                                        "emulator-5554\tunauthorized\n"
                                                        "HT4A1JT00123\toffline\n"
                                                        "ZX1G22\tdevice\n\n");
    success &= Tester::check(devices.size() == 2 && devices[0] == "0123456789ABCDEF" && devices[1] == "ZX1G22", "only authorized adb devices are listed");
    
    AdbBridge adb("adb");
    success &= Tester::check(adb.commandFor("devices") == "'adb' devices", "device listing is not pinned to a serial");
    adb.selectDevice("ZX1G22");
    success &= Tester::check(adb.commandFor("pull '/a' '/b'") == "'adb' -s 'ZX1G22' pull '/a' '/b'", "selected serial is passed with -s");
    return success;
}

static bool testStaging(const string &workDir) {
    bool success = true;
    const string fallback = "/tmp/brcmprobe/";
    success &= Tester::check(StagingDirManager("/tmp/.").getWorkDir() == fallback &&
                             StagingDirManager("/tmp/").getWorkDir() == fallback &&
                             StagingDirManager("/tmp").getWorkDir() == fallback, "/tmp itself is never the staging dir");
    success &= Tester::check(StagingDirManager("/tmp/../etc").getWorkDir() == fallback &&
                             StagingDirManager("/tmp/x/../../etc/").getWorkDir() == fallback &&
                             StagingDirManager("/home/user/staging").getWorkDir() == fallback &&
                             StagingDirManager("tmp/staging").getWorkDir() == fallback, "paths escaping /tmp fall back to the default");
    
    string inside = StringUtils::path_join(workDir, "stage/../staged");
    success &= Tester::check(StagingDirManager(inside).getWorkDir() == StringUtils::path_join(workDir, "staged") + "/",
                             "a path below /tmp is kept in normal form");
    
    // symlinks are resolved before the check
    string link = StringUtils::path_join(workDir, "escape");
    error_code ec;
    fs::create_directory_symlink("/", link, ec);
    success &= Tester::check(!ec && StagingDirManager(link).getWorkDir() == fallback &&
                             StagingDirManager(StringUtils::path_join(link, "etc")).getWorkDir() == fallback,
                             "symlink leaving /tmp falls back to the default");
    fs::remove(link, ec);
    
    // reset only wipes the confined dir
    string victim = StringUtils::path_join(workDir, "victim");
    fs::create_directories(victim);
    Tester::writeTextFile(StringUtils::path_join(victim, "keep.txt"), "keep");
    StagingDirManager staging(StringUtils::path_join(workDir, "stg/../stg2"));
    success &= Tester::check(staging.resetWorkDir() == 0 &&
                             fs::is_directory(StringUtils::path_join(workDir, "stg2")) &&
                             Tester::readTextFile(StringUtils::path_join(victim, "keep.txt")) == "keep", "reset leaves sibling directories alone");
    return success;
}

static bool testFilesystem(const string &workDir) {
    bool success = true;
    string fwDir = StringUtils::path_join(workDir, "fw");
    fs::create_directories(StringUtils::path_join(fwDir, "nested"));
    Tester::writeTextFile(StringUtils::path_join(fwDir, "fw_bcm43455c0.bin"), "BIN");
    Tester::writeTextFile(StringUtils::path_join(fwDir, "unrelated.txt"), "TXT");
    
    AcquirerDispatcher dispatcher(testConfig(workDir));
    vector<AcquiredBinary> binaries;
    bp_return_t ret = dispatcher.start(FirmwareSource::filesystem(fwDir), "bcm43455c0", "7_45_206", binaries);
    success &= Tester::check(ret == BP_SUCCESS && binaries.size() == 1 &&
                             binaries[0].filename == "fw_bcm43455c0.bin" &&
                             string(binaries[0].bytes.begin(), binaries[0].bytes.end()) == "BIN", "filesystem source yields only the .bin file");
    
    // recursive, ordered by file name
    Tester::writeTextFile(StringUtils::path_join(fwDir, "nested/brcmfmac43455-sdio.bin"), "NESTED");
    binaries.clear();
    ret = dispatcher.start(FirmwareSource::filesystem(fwDir), "bcm43455c0", "7_45_206", binaries);
    success &= Tester::check(ret == BP_SUCCESS && binaries.size() == 2 &&
                             binaries[0].filename == "brcmfmac43455-sdio.bin" &&
                             binaries[1].filename == "fw_bcm43455c0.bin", "nested files found and sorted by name");
    
    binaries.clear();
    ret = dispatcher.start(FirmwareSource::filesystem(StringUtils::path_join(workDir, "missing")), "bcm43455c0", "7_45_206", binaries);
    success &= Tester::check(ret == BP_SOURCE_UNAVAILABLE && binaries.empty(), "missing path is SourceUnavailable");
    
    string emptyDir = StringUtils::path_join(workDir, "empty");
    fs::create_directories(emptyDir);
    ret = dispatcher.start(FirmwareSource::filesystem(emptyDir), "bcm43455c0", "7_45_206", binaries);
    success &= Tester::check(ret == BP_NO_FILES_FOUND && binaries.empty(), "empty directory is NoFilesFound");
    
    ret = dispatcher.start(FirmwareSource::filesystem(StringUtils::path_join(fwDir, "unrelated.txt")), "bcm43455c0", "7_45_206", binaries);
    success &= Tester::check(ret == BP_SOURCE_UNAVAILABLE, "a regular file is not a filesystem source");
    return success;
}

static bool testImage(const string &workDir) {
    bool success = true;
    string mountRoot = StringUtils::path_join(workDir, "mnt");
    fs::create_directories(StringUtils::path_join(mountRoot, "vendor/firmware"));
    Tester::writeTextFile(StringUtils::path_join(mountRoot, "vendor/firmware/fw_bcm4358.bin"), "IMG");
    
    AcquirerDispatcher dispatcher(testConfig(workDir));
    vector<AcquiredBinary> binaries;
    bp_return_t ret = dispatcher.start(FirmwareSource::image(mountRoot), "bcm4358", "7_112_300_14_sta", binaries);
    success &= Tester::check(ret == BP_SUCCESS && binaries.size() == 1 && binaries[0].filename == "fw_bcm4358.bin", "mounted image root is scanned");
    
    string rawImage = StringUtils::path_join(workDir, "system.img");
    Tester::writeTextFile(rawImage, "raw");
    binaries.clear();
    ret = dispatcher.start(FirmwareSource::image(rawImage), "bcm4358", "7_112_300_14_sta", binaries);
    success &= Tester::check(ret == BP_SOURCE_UNAVAILABLE, "raw image without a mounter is SourceUnavailable");
    
    shared_ptr<FakeImageMounter> mounter = make_shared<FakeImageMounter>(mountRoot);
    AcquirerDispatcher mounting(testConfig(workDir), nullptr, mounter);
    binaries.clear();
    ret = mounting.start(FirmwareSource::image(rawImage), "bcm4358", "7_112_300_14_sta", binaries);
    success &= Tester::check(ret == BP_SUCCESS && binaries.size() == 1 &&
                             binaries[0].filename == "fw_bcm4358.bin" &&
                             string(binaries[0].bytes.begin(), binaries[0].bytes.end()) == "IMG" &&
                             mounter->mountedImages.size() == 1 && mounter->mountedImages[0] == rawImage,
                             "raw image is mounted and its root scanned");
    success &= Tester::check(mounter->unmountedRoots.size() == 1 && mounter->unmountedRoots[0] == mountRoot,
                             "mount root is released after a successful scan");
    
    string emptyRoot = StringUtils::path_join(workDir, "mnt-empty");
    fs::create_directories(StringUtils::path_join(emptyRoot, "vendor/firmware"));
    Tester::writeTextFile(StringUtils::path_join(emptyRoot, "vendor/firmware/nvram.txt"), "nvram");
    mounter = make_shared<FakeImageMounter>(emptyRoot);
    AcquirerDispatcher emptyImage(testConfig(workDir), nullptr, mounter);
    binaries.clear();
    ret = emptyImage.start(FirmwareSource::image(rawImage), "bcm4358", "7_112_300_14_sta", binaries);
    success &= Tester::check(ret == BP_NO_FILES_FOUND && binaries.empty() &&
                             mounter->unmountedRoots.size() == 1 && mounter->unmountedRoots[0] == emptyRoot,
                             "image without firmware is NoFilesFound and still unmounted");
    
    mounter = make_shared<FakeImageMounter>(mountRoot);
    mounter->mountSucceeds = false;
    AcquirerDispatcher brokenImage(testConfig(workDir), nullptr, mounter);
    binaries.clear();
    ret = brokenImage.start(FirmwareSource::image(rawImage), "bcm4358", "7_112_300_14_sta", binaries);
    success &= Tester::check(ret == BP_SOURCE_UNAVAILABLE && binaries.empty() &&
                             mounter->mountedImages.size() == 1 && mounter->unmountedRoots.empty(),
                             "failed mount is SourceUnavailable");
    return success;
}

static bool testBridge(const string &workDir) {
    bool success = true;
    ProbeConfig config = testConfig(workDir);
    
    shared_ptr<FakeBridgeTool> bridge = make_shared<FakeBridgeTool>();
    bridge->installed = false;
    AcquirerDispatcher missingTool(config, bridge);
    vector<AcquiredBinary> binaries;
    success &= Tester::check(missingTool.start(FirmwareSource::bridge(), "bcm4339", "6_37_34_43", binaries) == BP_SOURCE_UNAVAILABLE,
                             "missing bridge tool is SourceUnavailable");
    
    bridge = make_shared<FakeBridgeTool>();
    bridge->devices.clear();
    AcquirerDispatcher noDevice(config, bridge);
    success &= Tester::check(noDevice.start(FirmwareSource::bridge(), "bcm4339", "6_37_34_43", binaries) == BP_SOURCE_UNAVAILABLE,
                             "no authorized device is SourceUnavailable");
    
    bridge = make_shared<FakeBridgeTool>();
    bridge->remoteTree["/vendor/firmware"] = {"readme.txt"};
    AcquirerDispatcher nothing(config, bridge);
    success &= Tester::check(nothing.start(FirmwareSource::bridge(), "bcm4339", "6_37_34_43", binaries) == BP_NO_FILES_FOUND,
                             "no firmware on the device is NoFilesFound");
    
    // first remote directory with matches is used
    bridge = make_shared<FakeBridgeTool>();
    bridge->remoteTree["/vendor/firmware"] = {"readme.txt"};
    bridge->remoteTree["/system/vendor/firmware"] = {"fw_bcm4339.bin", "brcmfmac4339-sdio.bin", "nvram.txt"};
    bridge->remoteTree["/system/etc/firmware"] = {"fw_bcm4356.bin"};
    AcquirerDispatcher full(config, bridge);
    binaries.clear();
    bp_return_t ret = full.start(FirmwareSource::bridge(), "bcm4339", "6_37_34_43", binaries);
    success &= Tester::check(ret == BP_SUCCESS && binaries.size() == 2 &&
                             binaries[0].filename == "brcmfmac4339-sdio.bin" &&
                             binaries[1].originPath == "/system/vendor/firmware/fw_bcm4339.bin" &&
                             bridge->pulledPaths.size() == 2, "all matches of the first populated directory are pulled");
    
    bridge = make_shared<FakeBridgeTool>();
    bridge->remoteTree["/vendor/firmware"] = {"fw_bcm4339.bin", "fw_bcm4339_apsta.bin", "brcmfmac4339-sdio.bin"};
    bridge->brokenFiles = {"fw_bcm4339_apsta.bin"};
    AcquirerDispatcher partial(config, bridge);
    binaries.clear();
    ret = partial.start(FirmwareSource::bridge(), "bcm4339", "6_37_34_43", binaries);
    success &= Tester::check(ret == BP_PARTIAL_TRANSFER && binaries.size() == 2 &&
                             partial.lastTransferFailures.size() == 1 &&
                             partial.lastTransferFailures[0] == "fw_bcm4339_apsta.bin", "a failed pull keeps the other files");
    
    bridge->brokenFiles = {"fw_bcm4339.bin", "fw_bcm4339_apsta.bin", "brcmfmac4339-sdio.bin"};
    binaries.clear();
    ret = partial.start(FirmwareSource::bridge(), "bcm4339", "6_37_34_43", binaries);
    success &= Tester::check(ret == BP_TRANSFER_FAILED && binaries.empty() && partial.lastTransferFailures.size() == 3,
                             "every pull failing is TransferFailed");
    
    // several endpoints, shell and pull calls go to the first one
    bridge = make_shared<FakeBridgeTool>();
    bridge->devices = {"0123456789ABCDEF", "ZX1G22"};
    bridge->remoteTree["/vendor/firmware"] = {"fw_bcm4339.bin"};
    AcquirerDispatcher twoDevices(config, bridge);
    binaries.clear();
    ret = twoDevices.start(FirmwareSource::bridge(), "bcm4339", "6_37_34_43", binaries);
    success &= Tester::check(ret == BP_SUCCESS && binaries.size() == 1 && bridge->selectedDevice == "0123456789ABCDEF",
                             "first authorized device is selected for transfers");
    
    BufferedLogger *logger = BufferedLogger::globalLogger();
    logger->purgeBuffer(0);
    bridge = make_shared<FakeBridgeTool>();
    bridge->remoteTree["/vendor/firmware"] = {"fw_bcm4339.bin"};
    bridge->failingDirs = {"/vendor/firmware", "/system/vendor/firmware", "/system/etc/firmware"};
    AcquirerDispatcher unlistable(config, bridge);
    binaries.clear();
    ret = unlistable.start(FirmwareSource::bridge(), "bcm4339", "6_37_34_43", binaries);
    success &= Tester::check(ret == BP_SOURCE_UNAVAILABLE && binaries.empty() && bridge->pulledPaths.empty() &&
                             logger->containsLine("Cannot list firmware directories on device emulator-5554"),
                             "no listable directory is SourceUnavailable, not NoFilesFound");
    
    bridge->failingDirs = {"/vendor/firmware"};
    bridge->remoteTree["/system/etc/firmware"] = {"fw_bcm4339.bin"};
    binaries.clear();
    ret = unlistable.start(FirmwareSource::bridge(), "bcm4339", "6_37_34_43", binaries);
    success &= Tester::check(ret == BP_SUCCESS && binaries.size() == 1 &&
                             binaries[0].originPath == "/system/etc/firmware/fw_bcm4339.bin",
                             "an unlistable directory is skipped for the next one");
    return success;
}

bool TestFirmwareAcquirers::start() {
    printf("[*] Test firmware acquirers\n");
    string workDir = createTempDir();
    if (workDir.empty()) {
        return check(false, "cannot create temp dir");
    }
    
    bool success = true;
    success &= testNameMatching();
    success &= testStaging(workDir);
    success &= testFilesystem(workDir);
    success &= testImage(workDir);
    success &= testBridge(workDir);
    
    error_code ec;
    fs::remove_all(workDir, ec);
    return success;
}
