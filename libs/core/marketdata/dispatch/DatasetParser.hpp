#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "../model/SeriesData.h"

// Thrown for payloads that cannot be turned into a Dataset (bad JSON, missing
// candles, wrongly typed fields).
class DatasetParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Analytics payload -> Dataset.
// Keys: symbol, currentPrice, priceChange, candles, bbSeries, rsiSeries, patterns.
// Empty bbSeries / rsiSeries arrays decode to an absent overlay.
namespace DatasetParser {

DatasetPtr parse(const nlohmann::json& payload);
DatasetPtr parse(const std::string& body);

PatternClassification parseClassification(std::string_view text);
PatternStrength parseStrength(std::string_view text);

} // namespace DatasetParser
