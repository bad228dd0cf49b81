#pragma once

#include <optional>
#include <string>
#include <vector>

// Comma-delimited, RFC 4180 style quoting.
class CsvFormat {
public:
    static std::string escapeField(const std::string& field);
    static std::string joinRecord(const std::vector<std::string>& fields);

    // Plain decimal (ten places at most), never exponent notation; empty when absent.
    static std::string formatNumber(const std::optional<double>& value);
    static std::string formatInteger(const std::optional<int>& value);

    // Splits a whole document into records; quoted fields may span lines.
    static std::vector<std::vector<std::string>> parseRecords(const std::string& text);

    static std::optional<double> parseOptionalNumber(const std::string& field);
};
