//
//  StagingDirManager.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef StagingDirManager_hpp
#define StagingDirManager_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <string>

NS_BP_BEGIN

class StagingDirManager {
public:
    StagingDirManager(std::string workDir);
    std::string getWorkDir();
    int resetWorkDir();
    int createWorkDirIfNeeded();
    int cleanFolder();
    
    // copies filePath into the work dir under its own name, replacing an older copy
    int createShadowFile(std::string filePath, std::string &shadowPathOut /** OUT */);
    std::string pathForFile(std::string fileName);
    
private:
    std::string workDir;
};

NS_BP_END

#endif /* StagingDirManager_hpp */
