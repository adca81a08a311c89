//
//  ExtractCommandLine.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef ExtractCommandLine_hpp
#define ExtractCommandLine_hpp

#include <brcmprobe-core/cli/CommandLine.hpp>
#include <brcmprobe-core/pipeline/ExtractionPipeline.hpp>

NS_BP_BEGIN

class ExtractCommandLine : public CommandLine {
public:
    ExtractCommandLine();
    
    ExtractionRequest request;
    
    // Missing --source, --chip or --version is only an error without
    // --detect; the pipeline resolves and rechecks them.
    bp_return_t parse(int argc, const char *argv[], std::string &errorOut);
    virtual void printUsage();
};

NS_BP_END

#endif /* ExtractCommandLine_hpp */
