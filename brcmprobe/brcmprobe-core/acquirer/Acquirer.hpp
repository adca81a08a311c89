//
//  Acquirer.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef Acquirer_hpp
#define Acquirer_hpp

#include <brcmprobe-core/acquirer/FirmwareSource.hpp>
#include <brcmprobe-core/acquirer/context/StagingDirManager.hpp>
#include <brcmprobe-core/log/buffered_logger.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

NS_BP_BEGIN

struct AcquiredBinary {
    std::string filename;
    std::string originPath;
    std::vector<uint8_t> bytes;
    
    static bool loadFromFile(const std::string &path, std::vector<uint8_t> &bytesOut);
};

class Acquirer {
public:
    Acquirer(std::string identifier, std::string desc):
        identifier(identifier),
        desc(desc)
    {}
    
    virtual ~Acquirer() {};
    std::string identifier;
    std::string desc;
    std::string chipHint;
    std::string versionHint;
    std::shared_ptr<StagingDirManager> staging;
    
    // names of matched files that could not be transferred, in attempt order
    std::vector<std::string> transferFailures;
    
    // BP_SUCCESS, BP_PARTIAL_TRANSFER (binariesOut is not empty),
    // BP_SOURCE_UNAVAILABLE, BP_NO_FILES_FOUND or BP_TRANSFER_FAILED.
    // binariesOut is ordered by file name.
    virtual bp_return_t acquire(const FirmwareSource &source, std::vector<AcquiredBinary> &binariesOut) = 0;
    
    static void sortBinaries(std::vector<AcquiredBinary> &binaries);
};

NS_BP_END

#endif /* Acquirer_hpp */
