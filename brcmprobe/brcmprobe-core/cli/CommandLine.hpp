//
//  CommandLine.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef CommandLine_hpp
#define CommandLine_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <argparse.h>
#include <map>
#include <string>
#include <vector>

NS_BP_BEGIN

struct OptionSpec {
    std::vector<std::string> names;
    std::string description;
    bool takesValue;
};

class CommandLine {
public:
    CommandLine(std::string bin, std::string desc, std::vector<OptionSpec> options);
    virtual ~CommandLine() {};
    
    // Every token must be a known option or the value of one. Returns
    // BP_UNKNOWN_OPTION with "Unknown option: <token>" in errorOut, or
    // BP_INVALID_ARGUMENTS when an option lacks its value.
    bp_return_t prescan(int argc, const char *argv[], std::string &errorOut);
    
    bool helpRequested;
    std::string reportPath;
    std::map<std::string, std::string> extraData;
    
    virtual void printUsage();
    
protected:
    std::string bin;
    std::vector<OptionSpec> options;
    argparse::ArgumentParser parser;
    
    // prescan, argparse, then the options shared by both tools
    bp_return_t parseCommon(int argc, const char *argv[], std::string &errorOut);
    std::string valueOf(const std::string &name);
    const OptionSpec* optionForToken(const std::string &token);
};

NS_BP_END

#endif /* CommandLine_hpp */
