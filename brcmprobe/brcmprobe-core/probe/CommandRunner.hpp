//
//  CommandRunner.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef CommandRunner_hpp
#define CommandRunner_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <string>

NS_BP_BEGIN

class CommandRunner {
public:
    // executable name resolved through PATH, or an explicit path
    static bool isToolAvailable(const std::string &tool);
    
    // runs through /bin/sh, stdout captured, stderr discarded; returns exit status or -1
    static int run(const std::string &cmd, std::string &outputOut);
    static std::string shellQuote(const std::string &arg);
};

NS_BP_END

#endif /* CommandRunner_hpp */
