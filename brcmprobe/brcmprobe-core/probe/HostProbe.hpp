//
//  HostProbe.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef HostProbe_hpp
#define HostProbe_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <brcmprobe-core/config/ProbeConfig.hpp>
#include <memory>
#include <string>
#include <vector>

NS_BP_BEGIN

// Read-only views of the host. Every reader returns false when its signal
// source does not exist on this host.

class DeviceTreeReader {
public:
    virtual ~DeviceTreeReader() {};
    virtual bool readModel(std::string &modelOut) = 0;
};

class PropertyReader {
public:
    virtual ~PropertyReader() {};
    virtual bool isAvailable() = 0;
    virtual bool getProperty(const std::string &key, std::string &valueOut) = 0;
};

class KernelLogReader {
public:
    virtual ~KernelLogReader() {};
    virtual bool readLog(std::string &logOut) = 0;
};

class FirmwareDirectoryLister {
public:
    virtual ~FirmwareDirectoryLister() {};
    virtual bool isDirectory(const std::string &dir) = 0;
    
    // recursive, full paths of regular files whose name matches pattern (fnmatch)
    virtual bool findFiles(const std::string &dir, const std::string &pattern, std::vector<std::string> &filesOut) = 0;
};

class HostProbe {
public:
    // a null reader means the capability is absent
    std::shared_ptr<DeviceTreeReader> deviceTree;
    std::shared_ptr<PropertyReader> properties;
    std::shared_ptr<KernelLogReader> kernelLog;
    std::shared_ptr<FirmwareDirectoryLister> firmwareDirs;
    std::vector<std::string> firmwareSearchDirs;
    
    static std::shared_ptr<HostProbe> systemProbe(const ProbeConfig &config);
};

NS_BP_END

#endif /* HostProbe_hpp */
