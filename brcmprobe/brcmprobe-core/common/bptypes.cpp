//
//  bptypes.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "bptypes.h"

NS_BP_BEGIN

const char* bp_return_desc(bp_return_t code) {
    switch (code) {
        case BP_SUCCESS:
            return "success";
        case BP_INVALID_ARGUMENTS:
            return "invalid arguments";
        case BP_UNKNOWN_OPTION:
            return "unknown option";
        case BP_SOURCE_UNAVAILABLE:
            return "source unavailable";
        case BP_NO_FILES_FOUND:
            return "no firmware files found";
        case BP_PARTIAL_TRANSFER:
            return "partial transfer";
        case BP_TRANSFER_FAILED:
            return "transfer failed";
        case BP_SCAFFOLD_ERROR:
            return "cannot write firmware structure";
        case BP_DETECTION_INCONCLUSIVE:
            return "detection inconclusive";
        default:
            return "unknown error";
    }
}

NS_BP_END
