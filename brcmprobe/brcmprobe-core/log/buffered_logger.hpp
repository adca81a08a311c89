//
//  buffered_logger.hpp
//  brcmprobe-core
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#ifndef buffered_logger_hpp
#define buffered_logger_hpp

#include <brcmprobe-core/common/bptypes.h>
#include <string>
#include <vector>

NS_BP_BEGIN

enum LogLevel {
    LogLevelPlain = 0,
    LogLevelInfo,
    LogLevelSuccess,
    LogLevelWarning,
    LogLevelError
};

struct LogEntry {
    LogLevel level;
    std::string content;
};

class BufferedLogger {
public:
    BufferedLogger();
    
    static BufferedLogger* globalLogger();
    void purgeBuffer(uint64_t limit);
    void printBuffer();
    void append(std::string content, LogLevel level = LogLevelPlain);
    void info(std::string content);
    void success(std::string content);
    void warning(std::string content);
    void error(std::string content);
    std::string getBuffer();
    bool containsLine(const std::string &needle);
    
    // streaming mode prints every entry as soon as it is appended
    void startBuffer();
    void stopBuffer();
  
protected:
    static BufferedLogger *_globalInstance;
    std::vector<LogEntry> buffer;
    uint64_t bufferedBytes;
    bool useBuffer;
    
    void printEntry(const LogEntry &entry);
};

NS_BP_END

#endif /* buffered_logger_hpp */
