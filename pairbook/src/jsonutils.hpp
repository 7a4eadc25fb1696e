#pragma once

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace pairbook::json {

// Simple JSON value extraction (no external dependencies)
// Handles flat key-value pairs and arrays of flat objects only

inline size_t findValue(const std::string& json, const std::string& key)
{
    std::string searchKey = "\"" + key + "\"";
    auto keyPos = json.find(searchKey);
    if (keyPos == std::string::npos)
        return std::string::npos;

    auto colonPos = json.find(':', keyPos + searchKey.size());
    if (colonPos == std::string::npos)
        return std::string::npos;

    auto valueStart = colonPos + 1;
    while (valueStart < json.size() && std::isspace(static_cast<unsigned char>(json[valueStart])))
        ++valueStart;
    return valueStart;
}

inline bool hasKey(const std::string& json, const std::string& key)
{
    return findValue(json, key) != std::string::npos;
}

inline std::string extractString(const std::string& json, const std::string& key)
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos || valueStart >= json.size() || json[valueStart] != '"')
        return "";

    // Inverse of quote(): \" and \\ stand for the character itself
    std::string value;
    for (size_t pos = valueStart + 1; pos < json.size(); ++pos) {
        char c = json[pos];
        if (c == '"')
            return value;
        if (c == '\\') {
            if (++pos >= json.size())
                break;
            c = json[pos];
            if (c == 'n')
                c = '\n';
            else if (c == 't')
                c = '\t';
        }
        value += c;
    }
    return "";
}

// Unsigned integer value; 0 if the key is missing, throws on a malformed number.
// Quoted numbers are accepted so amounts above 2^53 survive JavaScript clients.
inline uint64_t extractUnsigned(const std::string& json, const std::string& key)
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos)
        return 0;

    if (valueStart < json.size() && json[valueStart] == '"')
        ++valueStart;

    std::string numStr;
    while (valueStart < json.size() && std::isdigit(static_cast<unsigned char>(json[valueStart]))) {
        numStr += json[valueStart];
        ++valueStart;
    }

    if (numStr.empty())
        throw std::invalid_argument("Expected unsigned integer for \"" + key + "\"");

    return std::stoull(numStr);
}

// Each {...} object of the array stored under key
inline std::vector<std::string> extractObjects(const std::string& json, const std::string& key)
{
    std::vector<std::string> objects;

    auto arrayStart = findValue(json, key);
    if (arrayStart == std::string::npos || arrayStart >= json.size() || json[arrayStart] != '[')
        return objects;

    auto arrayEnd = json.find(']', arrayStart);
    if (arrayEnd == std::string::npos)
        throw std::invalid_argument("Unterminated array for \"" + key + "\"");

    size_t pos = arrayStart;
    while (pos < arrayEnd) {
        auto objectStart = json.find('{', pos);
        if (objectStart == std::string::npos || objectStart > arrayEnd)
            break;

        auto objectEnd = json.find('}', objectStart);
        if (objectEnd == std::string::npos)
            throw std::invalid_argument("Unterminated object in \"" + key + "\"");

        objects.push_back(json.substr(objectStart, objectEnd - objectStart + 1));
        pos = objectEnd + 1;
    }

    return objects;
}

inline std::string quote(const std::string& value)
{
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace pairbook::json
