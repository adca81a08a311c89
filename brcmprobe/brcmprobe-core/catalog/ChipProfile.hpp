//
//  ChipProfile.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef ChipProfile_hpp
#define ChipProfile_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <string>
#include <vector>

NS_BP_BEGIN

struct FirmwareCandidate {
    std::string versionId;
    std::string relativePatchPath;
    int rank;
    std::string note;
};

class ChipProfile {
public:
    ChipProfile(std::string chipId, std::string displayName, std::vector<FirmwareCandidate> candidates):
        chipId(chipId),
        displayName(displayName),
        candidateFirmwareVersions(candidates)
    {}
    
    std::string chipId;
    std::string displayName;
    std::vector<FirmwareCandidate> candidateFirmwareVersions;
    
    // rank ascending, declaration order on ties
    std::vector<FirmwareCandidate> rankedCandidates() const;
    const FirmwareCandidate* candidateForVersion(const std::string &versionId) const;
    
    // "43455" for bcm43455c0, "4339" for bcm4339
    static std::string chipNumberFromId(const std::string &chipId);
};

NS_BP_END

#endif /* ChipProfile_hpp */
