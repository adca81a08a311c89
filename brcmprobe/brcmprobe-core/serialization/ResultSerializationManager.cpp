//
//  ResultSerializationManager.cpp
//  brcmprobe
//
//  Created by soulghost on 2026/10/19.
//  Copyright © 2026 soulghost. All rights reserved.
//

#include "ResultSerializationManager.hpp"
#include <brcmprobe-core/util/StringUtils.h>
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <termcolor/termcolor.hpp>
#include <fstream>
#include <iostream>

using namespace std;
using namespace brcmprobe;

static rapidjson::Value jsonString(string str, rapidjson::Document::AllocatorType &allocator) {
    rapidjson::Value stringValue(rapidjson::kStringType);
    stringValue.SetString(str.c_str(), (rapidjson::SizeType)str.length(), allocator);
    return stringValue;
}

static rapidjson::Value jsonStringArray(const vector<string> &strings, rapidjson::Document::AllocatorType &allocator) {
    rapidjson::Value array(rapidjson::kArrayType);
    for (const string &str : strings) {
        array.PushBack(jsonString(str, allocator), allocator);
    }
    return array;
}

static const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevelInfo:
            return "info";
        case LogLevelSuccess:
            return "success";
        case LogLevelWarning:
            return "warning";
        case LogLevelError:
            return "error";
        default:
            return "plain";
    }
}

static string writeDocument(rapidjson::Document &d) {
    rapidjson::StringBuffer strbuf;
    rapidjson::Writer<rapidjson::StringBuffer> writer(strbuf);
    d.Accept(writer);
    return strbuf.GetString();
}

static rapidjson::Value detectionObject(const DetectionOutcome &outcome, rapidjson::Document::AllocatorType &allocator) {
    rapidjson::Value detection(rapidjson::kObjectType);
    detection.AddMember("detected", outcome.detected, allocator);
    
    rapidjson::Value signature(rapidjson::kObjectType);
    for (auto &observed : outcome.signature.all()) {
        signature.AddMember(jsonString(DeviceSignature::kindName(observed.first), allocator), jsonString(observed.second, allocator), allocator);
    }
    detection.AddMember("signature", signature, allocator);
    
    rapidjson::Value attempts(rapidjson::kArrayType);
    for (const DetectionAttempt &attempt : outcome.attempts) {
        rapidjson::Value attemptObject(rapidjson::kObjectType);
        attemptObject.AddMember("id", jsonString(attempt.strategyId, allocator), allocator);
        attemptObject.AddMember("title", jsonString(attempt.title, allocator), allocator);
        attemptObject.AddMember("source_present", attempt.sourcePresent, allocator);
        attemptObject.AddMember("matched", attempt.matched, allocator);
        
        rapidjson::Value lines(rapidjson::kArrayType);
        for (const LogEntry &entry : attempt.lines) {
            rapidjson::Value line(rapidjson::kObjectType);
            line.AddMember("level", jsonString(logLevelName(entry.level), allocator), allocator);
            line.AddMember("text", jsonString(entry.content, allocator), allocator);
            lines.PushBack(line, allocator);
        }
        attemptObject.AddMember("lines", lines, allocator);
        attempts.PushBack(attemptObject, allocator);
    }
    detection.AddMember("attempts", attempts, allocator);
    
    if (!outcome.detected) {
        rapidjson::Value nullValue(rapidjson::kNullType);
        detection.AddMember("result", nullValue, allocator);
        return detection;
    }
    
    const DetectionResult &result = outcome.result;
    rapidjson::Value resultObject(rapidjson::kObjectType);
    resultObject.AddMember("strategy", jsonString(result.strategyId, allocator), allocator);
    resultObject.AddMember("confidence", jsonString(confidenceName(result.confidence), allocator), allocator);
    resultObject.AddMember("evidence", jsonString(result.evidence, allocator), allocator);
    
    rapidjson::Value chips(rapidjson::kArrayType);
    for (const ChipProfile *profile : result.chips) {
        rapidjson::Value chip(rapidjson::kObjectType);
        chip.AddMember("chip", jsonString(profile->chipId, allocator), allocator);
        chip.AddMember("display", jsonString(profile->displayName, allocator), allocator);
        
        rapidjson::Value candidates(rapidjson::kArrayType);
        for (const FirmwareCandidate &candidate : profile->rankedCandidates()) {
            rapidjson::Value candidateObject(rapidjson::kObjectType);
            candidateObject.AddMember("version", jsonString(candidate.versionId, allocator), allocator);
            candidateObject.AddMember("rank", candidate.rank, allocator);
            candidateObject.AddMember("note", jsonString(candidate.note, allocator), allocator);
            candidateObject.AddMember("patch", jsonString(candidate.relativePatchPath, allocator), allocator);
            candidates.PushBack(candidateObject, allocator);
        }
        chip.AddMember("candidates", candidates, allocator);
        chips.PushBack(chip, allocator);
    }
    resultObject.AddMember("chips", chips, allocator);
    detection.AddMember("result", resultObject, allocator);
    return detection;
}

string ResultSerializationManager::detectionReportJSON(const DetectionOutcome &outcome) {
    rapidjson::Document d;
    d.SetObject();
    rapidjson::Document::AllocatorType &allocator = d.GetAllocator();
    d.AddMember("version", jsonString(BP_REPORT_VERSION, allocator), allocator);
    d.AddMember("detection", detectionObject(outcome, allocator), allocator);
    return writeDocument(d);
}

string ResultSerializationManager::extractionReportJSON(const ExtractionResult &result, const DetectionOutcome *detection) {
    rapidjson::Document d;
    d.SetObject();
    rapidjson::Document::AllocatorType &allocator = d.GetAllocator();
    d.AddMember("version", jsonString(BP_REPORT_VERSION, allocator), allocator);
    
    rapidjson::Value extraction(rapidjson::kObjectType);
    extraction.AddMember("status", jsonString(ExtractionResult::statusName(result.status), allocator), allocator);
    extraction.AddMember("code", result.code, allocator);
    extraction.AddMember("code_desc", jsonString(bp_return_desc(result.code), allocator), allocator);
    extraction.AddMember("source", jsonString(result.source, allocator), allocator);
    extraction.AddMember("chip", jsonString(result.chipId, allocator), allocator);
    extraction.AddMember("firmware_version", jsonString(result.versionId, allocator), allocator);
    extraction.AddMember("output_dir", jsonString(result.outputDir, allocator), allocator);
    extraction.AddMember("files_written", jsonStringArray(result.filesWritten, allocator), allocator);
    extraction.AddMember("failed_step", jsonString(result.failedStep, allocator), allocator);
    extraction.AddMember("diagnostic", jsonString(result.diagnostic, allocator), allocator);
    extraction.AddMember("warnings", jsonStringArray(result.warnings, allocator), allocator);
    d.AddMember("extraction", extraction, allocator);
    
    if (detection) {
        d.AddMember("detection", detectionObject(*detection, allocator), allocator);
    }
    return writeDocument(d);
}

bool ResultSerializationManager::storeJSON(string path, const string &json) {
    ofstream ss(path);
    if (!ss.is_open()) {
        cout << termcolor::red;
        cout << StringUtils::format("  [!] cannot open output file %s\n", path.c_str());
        cout << termcolor::reset << endl;
        return false;
    }
    ss << json;
    ss.close();
    return !ss.fail();
}

bool ResultSerializationManager::storeDetectionReport(string path, const DetectionOutcome &outcome) {
    return storeJSON(path, detectionReportJSON(outcome));
}

bool ResultSerializationManager::storeExtractionReport(string path, const ExtractionResult &result, const DetectionOutcome *detection) {
    return storeJSON(path, extractionReportJSON(result, detection));
}
