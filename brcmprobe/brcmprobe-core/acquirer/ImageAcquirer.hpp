//
//  ImageAcquirer.hpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef ImageAcquirer_hpp
#define ImageAcquirer_hpp

#include <brcmprobe-core/acquirer/FilesystemAcquirer.hpp>

NS_BP_BEGIN

// turns a raw image file into a browsable root, e.g. a loop mount
class ImageMounter {
public:
    virtual ~ImageMounter() {};
    virtual bool mount(const std::string &imagePath, std::string &mountRootOut) = 0;
    virtual void unmount(const std::string &mountRoot) = 0;
};

class ImageAcquirer : public Acquirer {
public:
    ImageAcquirer(std::string name, std::string desc, std::shared_ptr<ImageMounter> mounter = nullptr):
        Acquirer(name, desc),
        mounter(mounter)
    {}
    
    virtual ~ImageAcquirer() {};
    virtual bp_return_t acquire(const FirmwareSource &source, std::vector<AcquiredBinary> &binariesOut);
    
private:
    std::shared_ptr<ImageMounter> mounter;
};

NS_BP_END

#endif /* ImageAcquirer_hpp */
