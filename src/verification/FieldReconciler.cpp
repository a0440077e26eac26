#include "FieldReconciler.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"
#include "../utils/Profile.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <cmath>
#include <locale>
#include <optional>
#include <sstream>

using json = nlohmann::json;

namespace verification
{

namespace
{

std::optional<double> tryParseConfidence(const json& value)
{
    double parsed = 0.0;
    if (value.is_number())
    {
        parsed = value.get<double>();
    }
    else if (value.is_string())
    {
        std::string text = trim(value.get_ref<const std::string&>());
        if (text.empty())
            return std::nullopt;

        std::istringstream iss(text);
        iss.imbue(std::locale::classic());
        iss >> parsed;
        if (iss.fail() || !iss.eof())
            return std::nullopt;
    }
    else
    {
        return std::nullopt;
    }

    if (!std::isfinite(parsed))
        return std::nullopt;
    return std::clamp(parsed, 0.0, 100.0);
}

bool isScalar(const json& value)
{
    return value.is_string() || value.is_number() || value.is_boolean();
}

std::string coerceValue(const std::string& key, const json& value, const char* side)
{
    if (!isScalar(value))
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[FieldReconciler] " << side << " value for '" << key
                                               << "' is " << value.type_name() << ", treating as empty";
    }
    return stringifyValue(value);
}

double coerceConfidence(const std::string& field, const json& value)
{
    auto parsed = tryParseConfidence(value);
    if (!parsed)
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[FieldReconciler] Confidence for '" << field
                                               << "' is not numeric (" << Diagnostics::PreviewJson(value)
                                               << "), using 0";
        return 0.0;
    }
    return *parsed;
}

std::string confidenceTarget(const std::string& key)
{
    const std::string suffix = kConfidenceSuffix;
    return key.substr(0, key.size() - suffix.size());
}

// Adds the top-level entries of an OCR object without overriding nested data
void collectTopLevel(const json& root, OcrFieldSource& out, bool contributes_keys)
{
    for (auto it = root.begin(); it != root.end(); ++it)
    {
        const std::string& key = it.key();
        if (endsWith(key, kConfidenceSuffix))
        {
            const std::string field = confidenceTarget(key);
            out.confidences.emplace(field, coerceConfidence(field, it.value()));
            continue;
        }
        if (isMetadataKey(key))
            continue;

        out.values.emplace(key, coerceValue(key, it.value(), "OCR"));
        if (contributes_keys)
            out.keys.insert(key);
    }
}

} // namespace

bool isMetadataKey(const std::string& key)
{
    if (endsWith(key, kConfidenceSuffix))
        return true;
    return std::any_of(kMetadataKeys.begin(), kMetadataKeys.end(),
                       [&key](const char* meta) { return key == meta; });
}

double parseConfidence(const json& value)
{
    return tryParseConfidence(value).value_or(0.0);
}

std::string stringifyValue(const json& value)
{
    switch (value.type())
    {
    case json::value_t::string:
        return value.get<std::string>();
    case json::value_t::boolean:
        return value.get<bool>() ? "true" : "false";
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
        return value.dump();
    default:
        return {};
    }
}

OcrPayload classifyOcrPayload(const json& ocr_data)
{
    if (!ocr_data.is_object())
    {
        return MalformedOcrPayload{ std::string("payload is ") + ocr_data.type_name() };
    }

    auto fields_it = ocr_data.find("fields");
    if (fields_it == ocr_data.end())
    {
        return FlatOcrPayload{ &ocr_data };
    }

    if (!fields_it->is_object())
    {
        return MalformedOcrPayload{ std::string("'fields' is ") + fields_it->type_name() };
    }

    const json* meta = nullptr;
    auto meta_it = ocr_data.find("fields_meta");
    if (meta_it != ocr_data.end() && meta_it->is_object())
    {
        meta = &*meta_it;
    }

    return NestedOcrPayload{ &ocr_data, &*fields_it, meta };
}

OcrField OcrFieldSource::lookup(const FieldKey& key) const
{
    OcrField field;
    if (auto it = values.find(key); it != values.end())
        field.value = it->second;
    if (auto it = confidences.find(key); it != confidences.end())
        field.confidence = it->second;
    return field;
}

OcrFieldSource normalizeOcrPayload(const OcrPayload& payload)
{
    OcrFieldSource source;

    if (const auto* flat = std::get_if<FlatOcrPayload>(&payload))
    {
        collectTopLevel(*flat->root, source, true);
    }
    else if (const auto* nested = std::get_if<NestedOcrPayload>(&payload))
    {
        for (auto it = nested->fields->begin(); it != nested->fields->end(); ++it)
        {
            if (isMetadataKey(it.key()))
                continue;
            source.values.emplace(it.key(), coerceValue(it.key(), it.value(), "OCR"));
            source.keys.insert(it.key());
        }

        if (nested->fields_meta)
        {
            for (auto it = nested->fields_meta->begin(); it != nested->fields_meta->end(); ++it)
            {
                if (!endsWith(it.key(), kConfidenceSuffix))
                    continue;
                const std::string field = confidenceTarget(it.key());
                source.confidences.emplace(field, coerceConfidence(field, it.value()));
            }
        }

        // Top level only fills gaps: fallback values and confidences
        collectTopLevel(*nested->root, source, false);
    }

    return source;
}

bool FieldReconciler::isAbsent(const json& data)
{
    return data.is_null() || data.is_discarded() || (data.is_object() && data.empty());
}

std::vector<ReconciledField> FieldReconciler::reconcile(const json& ocr_data, const json& user_data) const
{
    PROFILE_SCOPE_CUSTOM("FieldReconciler::reconcile");

    if (isAbsent(ocr_data) && isAbsent(user_data))
    {
        throw InvalidInputError("Missing data for verification: ocrData and userData are both empty");
    }

    OcrPayload payload = classifyOcrPayload(ocr_data);
    if (const auto* malformed = std::get_if<MalformedOcrPayload>(&payload))
    {
        if (!ocr_data.is_null())
        {
            PLOG_WARNING_(Diagnostics::kLogInstance)
                << "[FieldReconciler] Malformed OCR payload (" << malformed->reason << "), no OCR fields used";
        }
    }

    OcrFieldSource ocr_source = normalizeOcrPayload(payload);
    std::set<FieldKey> keys = ocr_source.keys;

    std::map<FieldKey, std::string> user_values;
    if (user_data.is_object())
    {
        for (auto it = user_data.begin(); it != user_data.end(); ++it)
        {
            if (isMetadataKey(it.key()))
                continue;
            user_values.emplace(it.key(), coerceValue(it.key(), it.value(), "User"));
            keys.insert(it.key());
        }
    }
    else if (!user_data.is_null())
    {
        PLOG_WARNING_(Diagnostics::kLogInstance)
            << "[FieldReconciler] Malformed user payload (payload is " << user_data.type_name()
            << "), no user fields used";
    }

    std::vector<ReconciledField> fields;
    fields.reserve(keys.size());
    for (const auto& key : keys)
    {
        OcrField ocr = ocr_source.lookup(key);

        ReconciledField field;
        field.key = key;
        field.ocrValue = std::move(ocr.value);
        field.ocrConfidence = ocr.confidence;
        if (auto it = user_values.find(key); it != user_values.end())
            field.userValue = it->second;
        fields.push_back(std::move(field));
    }

    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[FieldReconciler] " << fields.size() << " fields ("
                                               << ocr_source.keys.size() << " from OCR, " << user_values.size()
                                               << " from user)";
    }

    return fields;
}

} // namespace verification
