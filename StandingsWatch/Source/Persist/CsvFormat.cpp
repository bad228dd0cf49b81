#include "CsvFormat.h"
#include "../Utility/Utils.h"
#include <cmath>
#include <iomanip>
#include <sstream>

std::string CsvFormat::escapeField(const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    return "\"" + Utils::replace(field, "\"", "\"\"") + "\"";
}

std::string CsvFormat::joinRecord(const std::vector<std::string>& fields)
{
    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += ',';
        line += escapeField(fields[i]);
    }
    return line;
}

std::string CsvFormat::formatNumber(const std::optional<double>& value)
{
    if (!value || !std::isfinite(*value)) {
        return std::string();
    }
    // Plain decimal, never exponent notation; ten places, trailing zeros dropped
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(10) << *value;
    std::string out = oss.str();
    out.erase(out.find_last_not_of('0') + 1);
    if (!out.empty() && out.back() == '.') {
        out.pop_back();
    }
    if (out == "-0") {
        out = "0";
    }
    return out;
}

std::string CsvFormat::formatInteger(const std::optional<int>& value)
{
    return value ? std::to_string(*value) : std::string();
}

std::vector<std::vector<std::string>> CsvFormat::parseRecords(const std::string& text)
{
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool inQuotes = false;
    bool recordHasContent = false;

    auto endRecord = [&]() {
        if (recordHasContent || !field.empty() || !record.empty()) {
            record.push_back(field);
            records.push_back(record);
        }
        record.clear();
        field.clear();
        recordHasContent = false;
    };

    size_t i = 0;
    // Skip a UTF-8 byte order mark
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

    for (; i < text.size(); ++i) {
        char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                }
                else {
                    inQuotes = false;
                }
            }
            else {
                field += c;
            }
            continue;
        }

        if (c == '"') {
            inQuotes = true;
            recordHasContent = true;
        }
        else if (c == ',') {
            record.push_back(field);
            field.clear();
            recordHasContent = true;
        }
        else if (c == '\n') {
            endRecord();
        }
        else if (c != '\r') {
            field += c;
        }
    }
    endRecord();
    return records;
}

std::optional<double> CsvFormat::parseOptionalNumber(const std::string& field)
{
    std::string s = field;
    s = Utils::trim(s);
    if (s.empty()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        double value = std::stod(s, &used);
        if (used != s.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}
