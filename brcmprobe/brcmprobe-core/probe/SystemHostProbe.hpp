//
//  SystemHostProbe.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef SystemHostProbe_hpp
#define SystemHostProbe_hpp

#include <brcmprobe-core/probe/HostProbe.hpp>

NS_BP_BEGIN

class SystemDeviceTreeReader : public DeviceTreeReader {
public:
    SystemDeviceTreeReader(std::string modelPath): modelPath(modelPath) {}
    virtual bool readModel(std::string &modelOut);
    
private:
    std::string modelPath;
};

class SystemPropertyReader : public PropertyReader {
public:
    SystemPropertyReader(std::string tool): tool(tool) {}
    virtual bool isAvailable();
    virtual bool getProperty(const std::string &key, std::string &valueOut);
    
private:
    std::string tool;
};

class SystemKernelLogReader : public KernelLogReader {
public:
    SystemKernelLogReader(std::string tool): tool(tool) {}
    virtual bool readLog(std::string &logOut);
    
private:
    std::string tool;
};

class SystemFirmwareDirectoryLister : public FirmwareDirectoryLister {
public:
    virtual bool isDirectory(const std::string &dir);
    virtual bool findFiles(const std::string &dir, const std::string &pattern, std::vector<std::string> &filesOut);
};

NS_BP_END

#endif /* SystemHostProbe_hpp */
