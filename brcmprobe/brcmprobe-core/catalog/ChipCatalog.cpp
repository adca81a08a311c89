//
//  ChipCatalog.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "ChipCatalog.hpp"
#include <brcmprobe-core/util/StringUtils.h>
#include <regex>

using namespace std;
using namespace brcmprobe;

ChipCatalog* ChipCatalog::_sharedInstance = nullptr;

static FirmwareCandidate patchCandidate(string chipId, string versionId, int rank, string note = "") {
    return FirmwareCandidate{versionId, StringUtils::format("patches/%s/%s/nexmon/", chipId.c_str(), versionId.c_str()), rank, note};
}

static vector<ChipProfile> builtinProfiles() {
    return {
        ChipProfile("bcm43455c0", "Raspberry Pi 3B+/4/5", {
            patchCandidate("bcm43455c0", "7_45_206", 1, "Raspberry Pi OS"),
            patchCandidate("bcm43455c0", "7_45_189", 2, "Older kernels"),
            patchCandidate("bcm43455c0", "7_45_154", 3, "Legacy")
        }),
        ChipProfile("bcm43430a1", "Raspberry Pi 3/Zero W", {
            patchCandidate("bcm43430a1", "7_45_41_46", 1, "Recommended"),
            patchCandidate("bcm43430a1", "7_45_41_26", 2, "Legacy")
        }),
        ChipProfile("bcm43436b0", "Raspberry Pi Zero 2 W", {
            patchCandidate("bcm43436b0", "9_88_4_65", 1)
        }),
        ChipProfile("bcm4339", "Nexus 5", {
            patchCandidate("bcm4339", "6_37_34_43", 1)
        }),
        ChipProfile("bcm4356", "Nexus 6", {
            patchCandidate("bcm4356", "7_35_101_5_sta", 1)
        }),
        ChipProfile("bcm4358", "Nexus 6P", {
            patchCandidate("bcm4358", "7_112_300_14_sta", 1, "Android 8.0"),
            patchCandidate("bcm4358", "7_112_201_3_sta", 2, "Android 7.1.2"),
            patchCandidate("bcm4358", "7_112_200_17_sta", 3, "Android 7")
        })
    };
}

static vector<CatalogMatcher> builtinMatchers() {
    return {
        // "3 Model B Plus" has to be tried before "3 Model B"
        {CatalogTableBoardModel, MatchModeSubstring, "Raspberry Pi 3 Model B Plus", "bcm43455c0", "Raspberry Pi 3 Model B+"},
        {CatalogTableBoardModel, MatchModeSubstring, "Raspberry Pi 4", "bcm43455c0", "Raspberry Pi 4"},
        {CatalogTableBoardModel, MatchModeSubstring, "Raspberry Pi 5", "bcm43455c0", "Raspberry Pi 5"},
        {CatalogTableBoardModel, MatchModeSubstring, "Raspberry Pi 3 Model B", "bcm43430a1", "Raspberry Pi 3 Model B"},
        {CatalogTableBoardModel, MatchModeSubstring, "Raspberry Pi Zero W", "bcm43430a1", "Raspberry Pi Zero W"},
        {CatalogTableBoardModel, MatchModeSubstring, "Raspberry Pi Zero 2", "bcm43436b0", "Raspberry Pi Zero 2 W"},
        
        {CatalogTableDeviceCodename, MatchModeExact, "hammerhead", "bcm4339", "Nexus 5"},
        {CatalogTableDeviceCodename, MatchModeExact, "shamu", "bcm4356", "Nexus 6"},
        {CatalogTableDeviceCodename, MatchModeExact, "angler", "bcm4358", "Nexus 6P"},
        
        {CatalogTableChipFragment, MatchModeSubstring, "43430", "bcm43430a1", "Raspberry Pi 3/Zero W"},
        {CatalogTableChipFragment, MatchModeSubstring, "43455", "bcm43455c0", "Raspberry Pi 3+/4"},
        {CatalogTableChipFragment, MatchModeSubstring, "43436", "bcm43436b0", "Raspberry Pi Zero 2 W"},
        {CatalogTableChipFragment, MatchModeSubstring, "4339", "bcm4339", "Nexus 5"},
        {CatalogTableChipFragment, MatchModeSubstring, "4358", "bcm4358", "Nexus 6P"},
        {CatalogTableChipFragment, MatchModeSubstring, "4356", "bcm4356", "Nexus 6"}
    };
}

bool CatalogMatcher::matches(const string &text) const {
    if (mode == MatchModeExact) {
        return text == pattern;
    }
    return text.find(pattern) != string::npos;
}

ChipCatalog::ChipCatalog(vector<ChipProfile> profiles, vector<CatalogMatcher> matchers):
    profiles(profiles),
    matchers(matchers)
{}

ChipCatalog* ChipCatalog::sharedCatalog() {
    if (_sharedInstance == nullptr) {
        _sharedInstance = new ChipCatalog(builtinProfiles(), builtinMatchers());
    }
    return _sharedInstance;
}

bool ChipCatalog::isValidChipId(const string &chipId) {
    static const regex chipIdPattern("^bcm[0-9]+[a-z0-9]*$");
    return regex_match(chipId, chipIdPattern);
}

const vector<ChipProfile>& ChipCatalog::allProfiles() const {
    return profiles;
}

const ChipProfile* ChipCatalog::profileForChip(const string &chipId) const {
    for (const ChipProfile &profile : profiles) {
        if (profile.chipId == chipId) {
            return &profile;
        }
    }
    return nullptr;
}

vector<CatalogMatcher> ChipCatalog::matchersForTable(CatalogTable table) const {
    vector<CatalogMatcher> ret;
    for (const CatalogMatcher &matcher : matchers) {
        if (matcher.table == table) {
            ret.push_back(matcher);
        }
    }
    return ret;
}

const CatalogMatcher* ChipCatalog::match(CatalogTable table, const string &text) const {
    if (text.empty()) {
        return nullptr;
    }
    for (const CatalogMatcher &matcher : matchers) {
        if (matcher.table == table && matcher.matches(text)) {
            return &matcher;
        }
    }
    return nullptr;
}

const ChipProfile* ChipCatalog::matchBoardModel(const string &model) const {
    const CatalogMatcher *matcher = match(CatalogTableBoardModel, model);
    return matcher ? profileForChip(matcher->chipId) : nullptr;
}

const ChipProfile* ChipCatalog::matchDeviceCodename(const string &codename) const {
    const CatalogMatcher *matcher = match(CatalogTableDeviceCodename, codename);
    return matcher ? profileForChip(matcher->chipId) : nullptr;
}

const ChipProfile* ChipCatalog::matchChipFragment(const string &text) const {
    const CatalogMatcher *matcher = match(CatalogTableChipFragment, text);
    return matcher ? profileForChip(matcher->chipId) : nullptr;
}
