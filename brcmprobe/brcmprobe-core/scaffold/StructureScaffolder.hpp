//
//  StructureScaffolder.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef StructureScaffolder_hpp
#define StructureScaffolder_hpp

#include <brcmprobe-core/acquirer/Acquirer.hpp>
#include <brcmprobe-core/scaffold/ExtractionResult.hpp>

NS_BP_BEGIN

#define BP_DEFINITIONS_FILE "definitions.mk"
#define BP_MAKEFILE_FILE "Makefile"

class StructureScaffolder {
public:
    // Lays out <outputRoot>/<chipId>/<versionId>/. The binary is always
    // written and replaces an older one of the same name; definitions.mk and
    // the Makefile are only created when missing, so user edits survive.
    ExtractionResult scaffold(const std::string &chipId, const std::string &versionId, const AcquiredBinary &binary, const std::string &outputRoot);
    
    static std::string targetDirectory(const std::string &outputRoot, const std::string &chipId, const std::string &versionId);
    static std::string definitionsTemplate(const std::string &chipId, const std::string &versionId);
    static std::string makefileTemplate();
    
private:
    bool writeFile(const std::string &path, const char *data, size_t size, std::string &errorOut);
};

NS_BP_END

#endif /* StructureScaffolder_hpp */
