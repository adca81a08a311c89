/****************************************************************************
Copyright (c) 2014 cocos2d-x.org
Copyright (c) 2014-2016 Chukong Technologies Inc.
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

#ifndef stringutils_h
#define stringutils_h

#include <string>
#include <vector>

#if defined(__GNUC__) && (__GNUC__ >= 4)
#define BP_FORMAT_PRINTF(formatPos, argPos) __attribute__((__format__(printf, formatPos, argPos)))
#else
#define BP_FORMAT_PRINTF(formatPos, argPos)
#endif

namespace StringUtils {
std::string format(const char* format, ...) BP_FORMAT_PRINTF(1, 2);
std::vector<std::string> split(std::string s, char sep);
std::vector<std::string> split_lines(const std::string &s);
std::string join(const std::vector<std::string> &components, const std::string &sep);
bool has_prefix(const std::string &str, const std::string &prefix);
bool has_suffix(const std::string &str, const std::string &suffix);
bool contains_ignore_case(const std::string &str, const std::string &needle);
std::string to_lower(std::string s);
std::string trim(const std::string &s);
std::string strip_nul(const std::string &s);
std::string path_join(std::string a, std::string b);
std::string last_path_component(const std::string &path);
};

#endif /* stringutils_h */
