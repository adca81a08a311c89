//
//  buffered_logger.cpp
//  brcmprobe-core
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "buffered_logger.hpp"
#include <iostream>
#include <termcolor/termcolor.hpp>

#define DefaultPurgeLimit (1 * 1024 * 1024)

using namespace std;
using namespace brcmprobe;

BufferedLogger* BufferedLogger::_globalInstance = nullptr;

BufferedLogger* BufferedLogger::globalLogger() {
    if (_globalInstance == nullptr) {
        _globalInstance = new BufferedLogger();
    }
    return _globalInstance;
}

BufferedLogger::BufferedLogger() {
    bufferedBytes = 0;
    useBuffer = true;
}

void BufferedLogger::purgeBuffer(uint64_t limit) {
    if (bufferedBytes <= limit) {
        return;
    }
    buffer.clear();
    bufferedBytes = 0;
}

void BufferedLogger::append(string content, LogLevel level) {
    if (bufferedBytes + content.length() > DefaultPurgeLimit) {
        purgeBuffer(0);
    }
    
    LogEntry entry{level, content};
    if (__builtin_expect(!useBuffer, false)) {
        printEntry(entry);
        return;
    }
    buffer.push_back(entry);
    bufferedBytes += content.length();
}

void BufferedLogger::info(string content) {
    append("[*] " + content, LogLevelInfo);
}

void BufferedLogger::success(string content) {
    append("[+] " + content, LogLevelSuccess);
}

void BufferedLogger::warning(string content) {
    append("[!] " + content, LogLevelWarning);
}

void BufferedLogger::error(string content) {
    append("[-] " + content, LogLevelError);
}

void BufferedLogger::printEntry(const LogEntry &entry) {
    switch (entry.level) {
        case LogLevelSuccess:
            cout << termcolor::green;
            break;
        case LogLevelWarning:
            cout << termcolor::yellow;
            break;
        case LogLevelError:
            cout << termcolor::red;
            break;
        case LogLevelInfo:
            cout << termcolor::cyan;
            break;
        default:
            break;
    }
    cout << entry.content << termcolor::reset << endl;
}

void BufferedLogger::printBuffer() {
    for (const LogEntry &entry : buffer) {
        printEntry(entry);
    }
    buffer.clear();
    bufferedBytes = 0;
}

std::string BufferedLogger::getBuffer() {
    string content;
    for (const LogEntry &entry : buffer) {
        content += entry.content;
        content += "\n";
    }
    return content;
}

bool BufferedLogger::containsLine(const std::string &needle) {
    for (const LogEntry &entry : buffer) {
        if (entry.content.find(needle) != string::npos) {
            return true;
        }
    }
    return false;
}

void BufferedLogger::startBuffer() {
    useBuffer = true;
}

void BufferedLogger::stopBuffer() {
    printBuffer();
    useBuffer = false;
}
