/****************************************************************************
Copyright (c) 2008-2010 Ricardo Quesada
Copyright (c) 2010-2012 cocos2d-x.org
Copyright (c) 2011      Zynga Inc.
Copyright (c) 2013-2016 Chukong Technologies Inc.
Copyright (c) 2017-2018 Xiamen Yaji Software Co., Ltd.

http://www.cocos2d-x.org

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in
all copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
THE SOFTWARE.
****************************************************************************/

#include "StringUtils.h"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdarg.h>
#include <stdio.h>

namespace StringUtils {

std::string format(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    va_list argsCopy;
    va_copy(argsCopy, args);
    int needed = vsnprintf(nullptr, 0, format, args);
    va_end(args);
    
    if (needed <= 0) {
        va_end(argsCopy);
        return "";
    }
    
    std::string buffer((size_t)needed, '\0');
    vsnprintf(&buffer.front(), buffer.length() + 1, format, argsCopy);
    va_end(argsCopy);
    return buffer;
}

std::vector<std::string> split(std::string s, char sep) {
    std::stringstream ss(s);
    std::string component;
    std::vector<std::string> ret;
    while (getline(ss, component, sep)) {
        ret.push_back(component);
    }
    return ret;
}

std::vector<std::string> split_lines(const std::string &s) {
    std::vector<std::string> lines;
    for (std::string line : split(s, '\n')) {
        if (!line.empty() && line[line.length() - 1] == '\r') {
            line.erase(line.length() - 1);
        }
        lines.push_back(line);
    }
    return lines;
}

std::string join(const std::vector<std::string> &components, const std::string &sep) {
    std::string ret;
    for (size_t i = 0; i < components.size(); i++) {
        if (i > 0) {
            ret += sep;
        }
        ret += components[i];
    }
    return ret;
}

bool has_prefix(const std::string &str, const std::string &prefix)
{
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool has_suffix(const std::string &str, const std::string &suffix)
{
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains_ignore_case(const std::string &str, const std::string &needle) {
    return to_lower(str).find(to_lower(needle)) != std::string::npos;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return (char)std::tolower(c);
    });
    return s;
}

std::string trim(const std::string &s) {
    size_t begin = 0;
    while (begin < s.length() && std::isspace((unsigned char)s[begin])) {
        begin++;
    }
    size_t end = s.length();
    while (end > begin && std::isspace((unsigned char)s[end - 1])) {
        end--;
    }
    return s.substr(begin, end - begin);
}

// device-tree strings are NUL terminated
std::string strip_nul(const std::string &s) {
    std::string ret;
    for (char c : s) {
        if (c != '\0') {
            ret.push_back(c);
        }
    }
    return ret;
}

std::string path_join(std::string a, std::string b) {
    if (a.empty()) {
        return b;
    }
    if (a[a.length() - 1] == '/') {
        return a + b;
    }
    return a + "/" + b;
}

std::string last_path_component(const std::string &path) {
    std::vector<std::string> pathComponents = split(path, '/');
    if (pathComponents.empty()) {
        return path;
    }
    return pathComponents[pathComponents.size() - 1];
}

};
