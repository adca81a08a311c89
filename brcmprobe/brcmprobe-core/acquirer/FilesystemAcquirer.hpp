//
//  FilesystemAcquirer.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef FilesystemAcquirer_hpp
#define FilesystemAcquirer_hpp

#include <brcmprobe-core/acquirer/Acquirer.hpp>

NS_BP_BEGIN

class FilesystemAcquirer : public Acquirer {
public:
    FilesystemAcquirer(std::string name, std::string desc): Acquirer(name, desc) {}
    
    virtual ~FilesystemAcquirer() {};
    virtual bp_return_t acquire(const FirmwareSource &source, std::vector<AcquiredBinary> &binariesOut);
    
    // shared with the image acquirer once an image root is available
    bp_return_t acquireFromDirectory(const std::string &rootDir, std::vector<AcquiredBinary> &binariesOut);
    
    // matching regular files under rootDir, ordered by file name
    static std::vector<std::string> scanFirmwareFiles(const std::string &rootDir);
};

NS_BP_END

#endif /* FilesystemAcquirer_hpp */
