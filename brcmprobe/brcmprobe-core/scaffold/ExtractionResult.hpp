//
//  ExtractionResult.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef ExtractionResult_hpp
#define ExtractionResult_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <string>
#include <vector>

NS_BP_BEGIN

#define BP_STEP_ARGUMENTS "arguments"
#define BP_STEP_ACQUISITION "acquisition"
#define BP_STEP_SCAFFOLD "scaffold"

enum ExtractionStatus {
    ExtractionStatusSuccess = 0,
    ExtractionStatusPartialFailure,
    ExtractionStatusNotFound
};

struct ExtractionResult {
    std::string source;
    std::string chipId;
    std::string versionId;
    std::string outputDir;
    // file names relative to outputDir, in write order
    std::vector<std::string> filesWritten;
    ExtractionStatus status = ExtractionStatusNotFound;
    bp_return_t code = BP_SUCCESS;
    
    // empty on success
    std::string failedStep;
    std::string diagnostic;
    std::vector<std::string> warnings;
    
    bool succeeded() const { return status == ExtractionStatusSuccess; }
    void fail(ExtractionStatus status, bp_return_t code, std::string step, std::string diagnostic);
    
    static const char* statusName(ExtractionStatus status);
};

NS_BP_END

#endif /* ExtractionResult_hpp */
