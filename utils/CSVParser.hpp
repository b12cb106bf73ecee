#ifndef CSV_PARSER_HPP
#define CSV_PARSER_HPP

#include <string>
#include <unordered_map>
#include <vector>

class CSVParser {
public:
    // Split one record; quoted fields may contain commas and "" escapes
    static std::vector<std::string> parseLine(const std::string &line);

    // Blank lines and lines starting with '#' carry no record
    static bool isSkippable(const std::string &line);

    // Trim whitespace from both ends
    static std::string trim(const std::string &str);

    // Map lower-cased, trimmed header names to their column index
    static std::unordered_map<std::string, size_t> headerIndex(const std::vector<std::string> &header);
};

#endif // CSV_PARSER_HPP
