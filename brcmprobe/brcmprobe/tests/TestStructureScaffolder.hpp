//
//  TestStructureScaffolder.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef TestStructureScaffolder_hpp
#define TestStructureScaffolder_hpp

#include "Tester.hpp"

NS_BP_BEGIN

class TestStructureScaffolder : public Tester {
public:
    virtual ~TestStructureScaffolder() {};
    virtual bool start();
};

NS_BP_END

#endif /* TestStructureScaffolder_hpp */
