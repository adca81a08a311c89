//
//  FakeHostProbe.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef FakeHostProbe_hpp
#define FakeHostProbe_hpp

#include <brcmprobe-core/probe/HostProbe.hpp>
#include <brcmprobe-core/util/StringUtils.h>
#include <fnmatch.h>
#include <map>
#include <memory>

NS_BP_BEGIN

class FakeDeviceTreeReader : public DeviceTreeReader {
public:
    FakeDeviceTreeReader(std::string model): model(model) {}
    
    bool readModel(std::string &modelOut) {
        modelOut = model;
        return true;
    }
    
    std::string model;
};

class FakePropertyReader : public PropertyReader {
public:
    FakePropertyReader(std::map<std::string, std::string> properties): properties(properties) {}
    
    bool isAvailable() { return true; }
    
    bool getProperty(const std::string &key, std::string &valueOut) {
        auto it = properties.find(key);
        if (it == properties.end()) {
            return false;
        }
        valueOut = it->second;
        return true;
    }
    
    std::map<std::string, std::string> properties;
};

class FakeKernelLogReader : public KernelLogReader {
public:
    FakeKernelLogReader(std::string log): log(log) {}
    
    bool readLog(std::string &logOut) {
        logOut = log;
        return true;
    }
    
    std::string log;
};

// directory -> full paths of the files below it
class FakeFirmwareDirectoryLister : public FirmwareDirectoryLister {
public:
    FakeFirmwareDirectoryLister(std::map<std::string, std::vector<std::string>> tree): tree(tree) {}
    
    bool isDirectory(const std::string &dir) {
        return tree.find(dir) != tree.end();
    }
    
    bool findFiles(const std::string &dir, const std::string &pattern, std::vector<std::string> &filesOut) {
        auto it = tree.find(dir);
        if (it == tree.end()) {
            return false;
        }
        for (const std::string &file : it->second) {
            std::string name = StringUtils::last_path_component(file);
            if (fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
                filesOut.push_back(file);
            }
        }
        return true;
    }
    
    std::map<std::string, std::vector<std::string>> tree;
};

class FakeHostProbe : public HostProbe {
public:
    // starts with every capability absent
    FakeHostProbe() {
        firmwareSearchDirs = {"/lib/firmware/brcm", "/vendor/firmware", "/system/vendor/firmware"};
    }
    
    FakeHostProbe& withDeviceTree(std::string model) {
        deviceTree = std::make_shared<FakeDeviceTreeReader>(model);
        return *this;
    }
    
    FakeHostProbe& withProperties(std::map<std::string, std::string> props) {
        properties = std::make_shared<FakePropertyReader>(props);
        return *this;
    }
    
    FakeHostProbe& withKernelLog(std::string log) {
        kernelLog = std::make_shared<FakeKernelLogReader>(log);
        return *this;
    }
    
    FakeHostProbe& withFirmwareTree(std::map<std::string, std::vector<std::string>> tree) {
        firmwareDirs = std::make_shared<FakeFirmwareDirectoryLister>(tree);
        return *this;
    }
};

NS_BP_END

#endif /* FakeHostProbe_hpp */
