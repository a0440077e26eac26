#pragma once

#include "VerificationTypes.hpp"

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace verification
{

// Document-level metadata the OCR stage mixes into its field mapping
inline constexpr std::array<const char*, 9> kMetadataKeys = {
    "raw_text", "lines", "raw_lines", "text", "average_confidence",
    "fields", "fields_meta", "confidence", "error"
};

// Sibling keys "<field>_confidence" carry per-field confidence, never field data
inline constexpr const char* kConfidenceSuffix = "_confidence";

[[nodiscard]] bool isMetadataKey(const std::string& key);

/// Confidence coercion: numbers and numeric strings in, anything else is 0.
/// The result is clamped to [0, 100].
[[nodiscard]] double parseConfidence(const nlohmann::json& value);

/// Field value coercion: strings verbatim, numbers and booleans rendered,
/// null, objects and arrays become "".
[[nodiscard]] std::string stringifyValue(const nlohmann::json& value);

// Tagged shapes of an OCR payload. The pointers borrow from the parsed input.
struct FlatOcrPayload
{
    const nlohmann::json* root;
};

struct NestedOcrPayload
{
    const nlohmann::json* root;
    const nlohmann::json* fields;
    const nlohmann::json* fields_meta; // nullptr when absent or not an object
};

struct MalformedOcrPayload
{
    std::string reason;
};

using OcrPayload = std::variant<FlatOcrPayload, NestedOcrPayload, MalformedOcrPayload>;

[[nodiscard]] OcrPayload classifyOcrPayload(const nlohmann::json& ocr_data);

/**
 * @brief Canonical OCR field mapping, independent of the payload shape.
 *
 * `keys` are the OCR side's contribution to the reconciled key set. `values`
 * and `confidences` may hold more entries: a nested payload still falls back to
 * top-level values for keys only the user supplied.
 */
struct OcrFieldSource
{
    std::set<FieldKey> keys;
    std::map<FieldKey, std::string> values;
    std::map<FieldKey, double> confidences;

    [[nodiscard]] OcrField lookup(const FieldKey& key) const;
};

[[nodiscard]] OcrFieldSource normalizeOcrPayload(const OcrPayload& payload);

/**
 * @brief Aligns OCR output and reviewer input into one ordered field list.
 *
 * The key set is the union of both sides minus metadata keys, in ascending
 * byte-wise order. Malformed shapes and uncoercible values degrade to empty
 * fields; only a request with no data on either side is rejected.
 */
class FieldReconciler
{
public:
    /**
     * @throws InvalidInputError when both inputs are null or empty objects
     */
    [[nodiscard]] std::vector<ReconciledField> reconcile(const nlohmann::json& ocr_data,
                                                         const nlohmann::json& user_data) const;

    /// null, discarded and empty-object inputs count as absent
    [[nodiscard]] static bool isAbsent(const nlohmann::json& data);
};

} // namespace verification
