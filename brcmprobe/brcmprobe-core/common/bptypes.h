//
//  bptypes.h
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef brcmprobe_base_h
#define brcmprobe_base_h

#include <stdio.h>
#include <string>
#include <memory>
#include <brcmprobe-core/common/macro/CommonDefines.hpp>

typedef int bp_return_t;

#define BP_SUCCESS 0
#define BP_INVALID_ARGUMENTS 1
#define BP_UNKNOWN_OPTION 2
#define BP_SOURCE_UNAVAILABLE 3
#define BP_NO_FILES_FOUND 4
#define BP_PARTIAL_TRANSFER 5
#define BP_TRANSFER_FAILED 6
#define BP_SCAFFOLD_ERROR 7
#define BP_DETECTION_INCONCLUSIVE 8

NS_BP_BEGIN

const char* bp_return_desc(bp_return_t code);

NS_BP_END

#endif /* brcmprobe_base_h */
