//
//  ExtractionResult.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "ExtractionResult.hpp"

using namespace std;
using namespace brcmprobe;

void ExtractionResult::fail(ExtractionStatus status, bp_return_t code, string step, string diagnostic) {
    this->status = status;
    this->code = code;
    this->failedStep = step;
    this->diagnostic = diagnostic;
}

const char* ExtractionResult::statusName(ExtractionStatus status) {
    switch (status) {
        case ExtractionStatusSuccess:
            return "Success";
        case ExtractionStatusPartialFailure:
            return "PartialFailure";
        case ExtractionStatusNotFound:
            return "NotFound";
    }
    return "Unknown";
}
