//
//  ChipProfile.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "ChipProfile.hpp"
#include <algorithm>
#include <cctype>

using namespace std;
using namespace brcmprobe;

vector<FirmwareCandidate> ChipProfile::rankedCandidates() const {
    vector<FirmwareCandidate> ranked(candidateFirmwareVersions.begin(), candidateFirmwareVersions.end());
    stable_sort(ranked.begin(), ranked.end(), [](const FirmwareCandidate &a, const FirmwareCandidate &b) {
        return a.rank < b.rank;
    });
    return ranked;
}

const FirmwareCandidate* ChipProfile::candidateForVersion(const string &versionId) const {
    for (const FirmwareCandidate &candidate : candidateFirmwareVersions) {
        if (candidate.versionId == versionId) {
            return &candidate;
        }
    }
    return nullptr;
}

string ChipProfile::chipNumberFromId(const string &chipId) {
    string number;
    size_t i = 0;
    while (i < chipId.length() && !isdigit((unsigned char)chipId[i])) {
        i++;
    }
    while (i < chipId.length() && isdigit((unsigned char)chipId[i])) {
        number.push_back(chipId[i++]);
    }
    return number;
}
