//
//  FirmwareNameMatcher.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef FirmwareNameMatcher_hpp
#define FirmwareNameMatcher_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <string>
#include <vector>

NS_BP_BEGIN

class FirmwareNameMatcher {
public:
    // vendor naming (fw_bcm*.bin) and the brcmfmac naming
    static const std::vector<std::string>& patterns();
    static bool matches(const std::string &fileName);
};

NS_BP_END

#endif /* FirmwareNameMatcher_hpp */
