//
//  DetectCommandLine.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef DetectCommandLine_hpp
#define DetectCommandLine_hpp

#include <brcmprobe-core/cli/CommandLine.hpp>

NS_BP_BEGIN

class DetectCommandLine : public CommandLine {
public:
    DetectCommandLine();
    bp_return_t parse(int argc, const char *argv[], std::string &errorOut);
};

NS_BP_END

#endif /* DetectCommandLine_hpp */
