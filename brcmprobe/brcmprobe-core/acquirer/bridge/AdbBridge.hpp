//
//  AdbBridge.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef AdbBridge_hpp
#define AdbBridge_hpp

#include <brcmprobe-core/acquirer/bridge/BridgeTool.hpp>

NS_BP_BEGIN

class AdbBridge : public BridgeTool {
public:
    AdbBridge(std::string adbPath): adbPath(adbPath) {}
    
    virtual ~AdbBridge() {};
    virtual std::string name();
    virtual bool isInstalled();
    virtual std::vector<std::string> authorizedDevices();
    virtual void selectDevice(const std::string &serial);
    virtual bool listDirectory(const std::string &remoteDir, std::vector<std::string> &namesOut);
    virtual bool pull(const std::string &remotePath, const std::string &localPath);
    
    // "<serial>\tdevice" lines of `adb devices`; unauthorized and offline entries are skipped
    static std::vector<std::string> parseDeviceList(const std::string &output);
    
    // adb invocation for a subcommand, pinned to the selected serial
    std::string commandFor(const std::string &subcommand);
    
private:
    std::string adbPath;
    std::string serial;
    std::string adb();
};

NS_BP_END

#endif /* AdbBridge_hpp */
