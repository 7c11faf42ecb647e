#include "DatasetParser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>
#include <fmt/format.h>

using nlohmann::json;

namespace {

std::string lowered(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Accepts JSON numbers and numeric strings; the whole string must be a finite number
double readNumber(const json& obj, const char* key, const char* context, size_t index) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        throw DatasetParseError(fmt::format("{}[{}] is missing '{}'", context, index, key));
    }
    double value = 0.0;
    if (it->is_number()) {
        value = it->get<double>();
    } else if (it->is_string()) {
        const std::string& text = it->get_ref<const std::string&>();
        const char* first = text.data();
        const char* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            throw DatasetParseError(fmt::format("{}[{}].{} is not numeric", context, index, key));
        }
    } else {
        throw DatasetParseError(fmt::format("{}[{}].{} has unexpected type {}", context, index, key, it->type_name()));
    }
    if (!std::isfinite(value)) {
        throw DatasetParseError(fmt::format("{}[{}].{} is not finite", context, index, key));
    }
    return value;
}

// Unix seconds: integral and representable as int64
int64_t readTime(const json& obj, const char* context, size_t index) {
    auto it = obj.find("time");
    if (it != obj.end() && it->is_number_integer()) {
        if (it->is_number_unsigned() && it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw DatasetParseError(fmt::format("{}[{}].time is out of range", context, index));
        }
        return it->get<int64_t>();
    }
    const double t = readNumber(obj, "time", context, index);
    // 2^63 is exactly representable; anything at or beyond it does not fit
    if (t < -9223372036854775808.0 || t >= 9223372036854775808.0) {
        throw DatasetParseError(fmt::format("{}[{}].time is out of range", context, index));
    }
    if (std::trunc(t) != t) {
        throw DatasetParseError(fmt::format("{}[{}].time is not a whole number of seconds", context, index));
    }
    return static_cast<int64_t>(t);
}

const json& requireArray(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_array()) {
        throw DatasetParseError(fmt::format("payload has no '{}' array", key));
    }
    return *it;
}

std::vector<CandlePoint> parseCandles(const json& arr) {
    std::vector<CandlePoint> candles;
    candles.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        const auto& c = arr[i];
        if (!c.is_object()) throw DatasetParseError(fmt::format("candles[{}] is not an object", i));
        CandlePoint point;
        point.time  = readTime(c, "candles", i);
        point.open  = readNumber(c, "open", "candles", i);
        point.high  = readNumber(c, "high", "candles", i);
        point.low   = readNumber(c, "low", "candles", i);
        point.close = readNumber(c, "close", "candles", i);
        if (c.contains("volume") && !c["volume"].is_null()) {
            point.volume = readNumber(c, "volume", "candles", i);
        }
        candles.push_back(point);
    }
    return candles;
}

std::optional<std::vector<BandPoint>> parseBands(const json& payload) {
    auto it = payload.find("bbSeries");
    if (it == payload.end() || it->is_null()) return std::nullopt;
    if (!it->is_array()) throw DatasetParseError("'bbSeries' is not an array");
    if (it->empty()) return std::nullopt;

    std::vector<BandPoint> bands;
    bands.reserve(it->size());
    for (size_t i = 0; i < it->size(); ++i) {
        const auto& b = (*it)[i];
        if (!b.is_object()) throw DatasetParseError(fmt::format("bbSeries[{}] is not an object", i));
        BandPoint point;
        point.time   = readTime(b, "bbSeries", i);
        point.upper  = readNumber(b, "upper", "bbSeries", i);
        point.middle = readNumber(b, "middle", "bbSeries", i);
        point.lower  = readNumber(b, "lower", "bbSeries", i);
        bands.push_back(point);
    }
    return bands;
}

std::optional<std::vector<ScalarPoint>> parseOscillator(const json& payload) {
    auto it = payload.find("rsiSeries");
    if (it == payload.end() || it->is_null()) return std::nullopt;
    if (!it->is_array()) throw DatasetParseError("'rsiSeries' is not an array");
    if (it->empty()) return std::nullopt;

    std::vector<ScalarPoint> series;
    series.reserve(it->size());
    for (size_t i = 0; i < it->size(); ++i) {
        const auto& r = (*it)[i];
        if (!r.is_object()) throw DatasetParseError(fmt::format("rsiSeries[{}] is not an object", i));
        ScalarPoint point;
        point.time  = readTime(r, "rsiSeries", i);
        point.value = readNumber(r, "value", "rsiSeries", i);
        series.push_back(point);
    }
    return series;
}

std::vector<PatternEvent> parsePatterns(const json& payload) {
    std::vector<PatternEvent> patterns;
    auto it = payload.find("patterns");
    if (it == payload.end() || it->is_null()) return patterns;
    if (!it->is_array()) throw DatasetParseError("'patterns' is not an array");

    for (size_t i = 0; i < it->size(); ++i) {
        const auto& p = (*it)[i];
        if (!p.is_object()) throw DatasetParseError(fmt::format("patterns[{}] is not an object", i));
        if (!p.value("detected", true)) continue;

        PatternEvent event;
        event.label = p.contains("name") ? p.value("name", "") : p.value("label", "");
        const std::string kind = p.contains("type") ? p.value("type", "") : p.value("classification", "");
        event.classification = DatasetParser::parseClassification(kind);
        event.strength = DatasetParser::parseStrength(p.value("strength", ""));
        patterns.push_back(std::move(event));
    }
    return patterns;
}

std::optional<double> optionalNumber(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_number()) return std::nullopt;
    const double value = it->get<double>();
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

} // namespace

namespace DatasetParser {

PatternClassification parseClassification(std::string_view text) {
    const std::string s = lowered(text);
    if (s == "bullish") return PatternClassification::Bullish;
    if (s == "bearish") return PatternClassification::Bearish;
    return PatternClassification::Neutral;
}

PatternStrength parseStrength(std::string_view text) {
    const std::string s = lowered(text);
    if (s == "weak")   return PatternStrength::Weak;
    if (s == "strong") return PatternStrength::Strong;
    return PatternStrength::Moderate;
}

DatasetPtr parse(const json& payload) {
    if (!payload.is_object()) {
        throw DatasetParseError("payload is not a JSON object");
    }

    auto dataset = std::make_shared<Dataset>();
    dataset->symbol = payload.value("symbol", "");
    dataset->candles = parseCandles(requireArray(payload, "candles"));
    dataset->bandOverlay = parseBands(payload);
    dataset->oscillatorSeries = parseOscillator(payload);
    dataset->patterns = parsePatterns(payload);
    dataset->currentPrice = optionalNumber(payload, "currentPrice");
    dataset->priceChange = optionalNumber(payload, "priceChange");
    return dataset;
}

DatasetPtr parse(const std::string& body) {
    json payload;
    try {
        payload = json::parse(body);
    } catch (const json::parse_error& e) {
        throw DatasetParseError(fmt::format("invalid JSON: {}", e.what()));
    }
    try {
        return parse(payload);
    } catch (const json::exception& e) {
        throw DatasetParseError(fmt::format("unexpected payload shape: {}", e.what()));
    }
}

} // namespace DatasetParser
