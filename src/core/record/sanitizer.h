#pragma once

#include "core/shared/types.h"
#include "core/shared/write_error.h"

#include <QDateTime>
#include <QString>
#include <optional>

namespace elf {

// Sanitizer -- validates and cleans untrusted record input.
//
// Every function is pure: no filesystem, database or clock access.
// Text cleaning:
// 1. Strip ANSI CSI escape sequences (ESC [ ... final byte)
// 2. Strip C0/C1 control characters and DEL, keeping tab, and newline
//    only in multi-line (body) fields
// 3. Normalize \r\n and \r to \n (body) or to a space (single-line)
// 4. Collapse runs of spaces to one space, trim both ends
//
// Length limits are enforced on the cleaned value and are never satisfied
// by truncation: an over-long value is a Validation error.
class Sanitizer {
public:
    enum class Field {
        Domain,
        Title,
        Summary,
        Tag,
    };

    static constexpr int kMaxDomainLength = 100;
    static constexpr int kMaxTitleLength = 500;
    static constexpr int kMaxHeuristicExplanationLength = 5000;
    static constexpr int kMaxSummaryLength = 50000;
    static constexpr int kMaxTagLength = 50;
    static constexpr int kMaxTagsJoinedLength = 500;
    static constexpr int kMaxTitleSlugLength = 100;
    static constexpr int kHashTokenLength = 12;

    static QString fieldName(Field field);
    static int maxLength(Field field, LearningType type);

    // Clean `value` for `field`. Returns nullopt (and fills *error with a
    // Validation error) when the cleaned value is empty for a required field
    // or longer than the field allows.
    static std::optional<QString> sanitize(Field field, const QString& value,
                                           LearningType type, WriteError* error);

    // Strip control characters and normalize whitespace without validating.
    static QString cleanText(const QString& raw, bool multiLine);

    // Strict numeric patterns. No clamping, no word-to-number mapping.
    static std::optional<int> parseSeverity(const QString& value, WriteError* error);
    static std::optional<double> parseConfidence(const QString& value, WriteError* error);

    // Filesystem-safe slug: lower-case, whitespace to '-', only [a-z0-9-],
    // no leading/trailing/repeated '-', at most maxLength characters.
    // Falls back to "h" + a content hash of `fallbackSeed` when the result
    // would be empty, and suffixes Windows device names (con, nul, ...).
    static QString slugify(const QString& value, int maxLength, const QString& fallbackSeed);

    // Short hex token derived from SHA-256 of seed.
    static QString hashToken(const QString& seed, int length = kHashTokenLength);

    // Validate and clean a full input. created_at feeds the hash fallback
    // seed so two records whose titles both sanitize to nothing still get
    // distinct file names. The filepath is not derived here.
    static std::optional<LearningRecord> sanitizeRecord(const RecordInput& input,
                                                        const QDateTime& createdAt,
                                                        WriteError* error);
};

} // namespace elf
