//
//  ChipCatalog.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef ChipCatalog_hpp
#define ChipCatalog_hpp

#include <brcmprobe-core/catalog/ChipProfile.hpp>
#include <string>
#include <vector>

NS_BP_BEGIN

enum CatalogTable {
    CatalogTableBoardModel = 0,
    CatalogTableDeviceCodename,
    CatalogTableChipFragment
};

enum MatchMode {
    MatchModeSubstring = 0,
    MatchModeExact
};

struct CatalogMatcher {
    CatalogTable table;
    MatchMode mode;
    std::string pattern;
    std::string chipId;
    std::string label;
    
    bool matches(const std::string &text) const;
};

class ChipCatalog {
public:
    ChipCatalog(std::vector<ChipProfile> profiles, std::vector<CatalogMatcher> matchers);
    
    static ChipCatalog* sharedCatalog();
    static bool isValidChipId(const std::string &chipId);
    
    const std::vector<ChipProfile>& allProfiles() const;
    const ChipProfile* profileForChip(const std::string &chipId) const;
    
    // matchers of one table, in declaration (= priority) order
    std::vector<CatalogMatcher> matchersForTable(CatalogTable table) const;
    
    // first matcher of the table accepting text, nullptr if none does
    const CatalogMatcher* match(CatalogTable table, const std::string &text) const;
    const ChipProfile* matchBoardModel(const std::string &model) const;
    const ChipProfile* matchDeviceCodename(const std::string &codename) const;
    const ChipProfile* matchChipFragment(const std::string &text) const;
    
private:
    static ChipCatalog *_sharedInstance;
    std::vector<ChipProfile> profiles;
    std::vector<CatalogMatcher> matchers;
};

NS_BP_END

#endif /* ChipCatalog_hpp */
