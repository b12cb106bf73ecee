#include "CSVParser.hpp"
#include <algorithm>
#include <cctype>

// Parse a CSV line with RFC 4180 quote handling
std::vector<std::string> CSVParser::parseLine(const std::string &line) {
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;

    for (size_t i = 0; i < line.length(); i++) {
        char c = line[i];

        if (inQuotes) {
            if (c == '"' && i + 1 < line.length() && line[i + 1] == '"') {
                field += '"';
                i++;
            } else if (c == '"') {
                inQuotes = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            inQuotes = true;
        } else if (c == ',') {
            fields.push_back(trim(field));
            field.clear();
        } else if (c != '\r') {
            field += c;
        }
    }

    fields.push_back(trim(field));
    return fields;
}

bool CSVParser::isSkippable(const std::string &line) {
    std::string trimmed = trim(line);
    return trimmed.empty() || trimmed.front() == '#';
}

// Trim whitespace from both ends
std::string CSVParser::trim(const std::string &str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::unordered_map<std::string, size_t> CSVParser::headerIndex(const std::vector<std::string> &header) {
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < header.size(); i++) {
        std::string name = trim(header[i]);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        index[name] = i;
    }
    return index;
}
