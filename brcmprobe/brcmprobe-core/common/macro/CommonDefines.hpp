//
//  CommonDefines.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef CommonDefines_hpp
#define CommonDefines_hpp

#define NS_BP_BEGIN namespace brcmprobe {
#define NS_BP_END }

#endif /* CommonDefines_hpp */
