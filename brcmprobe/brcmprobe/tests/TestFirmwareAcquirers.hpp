//
//  TestFirmwareAcquirers.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef TestFirmwareAcquirers_hpp
#define TestFirmwareAcquirers_hpp

#include "Tester.hpp"

NS_BP_BEGIN

class TestFirmwareAcquirers : public Tester {
public:
    virtual ~TestFirmwareAcquirers() {};
    virtual bool start();
};

NS_BP_END

#endif /* TestFirmwareAcquirers_hpp */
