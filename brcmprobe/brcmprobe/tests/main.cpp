//
//  main.cpp
//  brcmprobe-tests
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include <cstdio>
#include <iostream>
#include <termcolor/termcolor.hpp>
#include "TestManager.hpp"

using namespace std;
using namespace brcmprobe;

int main(int argc, const char *argv[]) {
    printf("[***] brcmprobe test suite\n\n");
    if (!TestManager::testAll()) {
        cout << termcolor::red << "\n[-] Some tests failed" << termcolor::reset << endl;
        return 1;
    }
    cout << termcolor::green << "\n[+] All tests passed" << termcolor::reset << endl;
    return 0;
}
