//
//  Acquirer.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "Acquirer.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

using namespace std;
using namespace brcmprobe;

bool AcquiredBinary::loadFromFile(const string &path, vector<uint8_t> &bytesOut) {
    ifstream file(path, ios::binary);
    if (!file.is_open()) {
        return false;
    }
    bytesOut.assign(istreambuf_iterator<char>(file), istreambuf_iterator<char>());
    return !file.bad();
}

void Acquirer::sortBinaries(vector<AcquiredBinary> &binaries) {
    stable_sort(binaries.begin(), binaries.end(), [](const AcquiredBinary &a, const AcquiredBinary &b) {
        if (a.filename != b.filename) {
            return a.filename < b.filename;
        }
        return a.originPath < b.originPath;
    });
}
