#include "core/record/sanitizer.h"

#include <QCryptographicHash>
#include <QRegularExpression>
#include <QSet>

namespace elf {

namespace {

const QString kStep = QStringLiteral("sanitizer");

bool isWindowsDeviceName(const QString& slug)
{
    static const QSet<QString> kReserved = {
        QStringLiteral("con"),  QStringLiteral("prn"),  QStringLiteral("aux"),
        QStringLiteral("nul"),  QStringLiteral("com1"), QStringLiteral("com2"),
        QStringLiteral("com3"), QStringLiteral("com4"), QStringLiteral("com5"),
        QStringLiteral("com6"), QStringLiteral("com7"), QStringLiteral("com8"),
        QStringLiteral("com9"), QStringLiteral("lpt1"), QStringLiteral("lpt2"),
        QStringLiteral("lpt3"), QStringLiteral("lpt4"), QStringLiteral("lpt5"),
        QStringLiteral("lpt6"), QStringLiteral("lpt7"), QStringLiteral("lpt8"),
        QStringLiteral("lpt9"),
    };
    return kReserved.contains(slug);
}

// Length of an ANSI CSI sequence starting at raw[i] (which is ESC), or 0.
int csiSequenceLength(const QString& raw, int i)
{
    if (i + 1 >= raw.size() || raw[i + 1] != QLatin1Char('[')) {
        return 0;
    }
    int j = i + 2;
    while (j < raw.size()) {
        const ushort code = raw[j].unicode();
        if (code >= 0x40 && code <= 0x7E) {
            return j - i + 1;
        }
        if (code < 0x20 || code > 0x3F) {
            break;
        }
        ++j;
    }
    return 0;
}

} // namespace

QString Sanitizer::fieldName(Field field)
{
    switch (field) {
    case Field::Domain:  return QStringLiteral("domain");
    case Field::Title:   return QStringLiteral("title");
    case Field::Summary: return QStringLiteral("summary");
    case Field::Tag:     return QStringLiteral("tag");
    }
    return QStringLiteral("field");
}

int Sanitizer::maxLength(Field field, LearningType type)
{
    switch (field) {
    case Field::Domain:
        return kMaxDomainLength;
    case Field::Title:
        return kMaxTitleLength;
    case Field::Summary:
        return type == LearningType::Heuristic ? kMaxHeuristicExplanationLength
                                               : kMaxSummaryLength;
    case Field::Tag:
        return kMaxTagLength;
    }
    return kMaxTitleLength;
}

QString Sanitizer::cleanText(const QString& raw, bool multiLine)
{
    if (raw.isEmpty()) {
        return raw;
    }

    QString result;
    result.reserve(raw.size());

    // Pass 1: drop escape sequences and control characters, normalize breaks
    for (int i = 0; i < raw.size(); ++i) {
        const QChar ch = raw[i];
        const ushort code = ch.unicode();

        if (code == 0x1B) {
            const int skip = csiSequenceLength(raw, i);
            if (skip > 0) {
                i += skip - 1;
            }
            continue;
        }

        if (code == '\r') {
            if (i + 1 < raw.size() && raw[i + 1] == QLatin1Char('\n')) {
                ++i;
            }
            result.append(multiLine ? QLatin1Char('\n') : QLatin1Char(' '));
            continue;
        }
        if (code == '\n') {
            result.append(multiLine ? QLatin1Char('\n') : QLatin1Char(' '));
            continue;
        }
        if (code == '\t') {
            result.append(multiLine ? QLatin1Char('\t') : QLatin1Char(' '));
            continue;
        }

        if (code < 0x20 || code == 0x7F || (code >= 0x80 && code <= 0x9F)) {
            continue;
        }

        result.append(ch);
    }

    // Pass 2: collapse runs of spaces
    QString collapsed;
    collapsed.reserve(result.size());
    for (int i = 0; i < result.size(); ++i) {
        if (result[i] == QLatin1Char(' ') && !collapsed.isEmpty()
            && collapsed.back() == QLatin1Char(' ')) {
            continue;
        }
        collapsed.append(result[i]);
    }

    return collapsed.trimmed();
}

std::optional<QString> Sanitizer::sanitize(Field field, const QString& value,
                                           LearningType type, WriteError* error)
{
    const bool multiLine = field == Field::Summary;
    const QString cleaned = cleanText(value, multiLine);
    const QString name = fieldName(field);

    const bool required = field == Field::Domain || field == Field::Title;
    if (required && cleaned.isEmpty()) {
        setError(error, ErrorKind::Validation, kStep,
                 QStringLiteral("%1 cannot be empty").arg(name));
        return std::nullopt;
    }

    const int limit = maxLength(field, type);
    if (cleaned.size() > limit) {
        setError(error, ErrorKind::Validation, kStep,
                 QStringLiteral("%1 exceeds maximum length (%2 > %3 characters)")
                     .arg(name)
                     .arg(cleaned.size())
                     .arg(limit));
        return std::nullopt;
    }

    return cleaned;
}

std::optional<int> Sanitizer::parseSeverity(const QString& value, WriteError* error)
{
    static const QRegularExpression kPattern(QStringLiteral("^[1-5]$"));
    const QString trimmed = value.trimmed();
    if (!kPattern.match(trimmed).hasMatch()) {
        setError(error, ErrorKind::Validation, kStep,
                 QStringLiteral("severity must be an integer from 1 to 5, got '%1'")
                     .arg(trimmed.left(32)));
        return std::nullopt;
    }
    return trimmed.toInt();
}

std::optional<double> Sanitizer::parseConfidence(const QString& value, WriteError* error)
{
    // 0, 1, 0.x, 1.0..., .x -- never 1.x with a non-zero fraction
    static const QRegularExpression kPattern(
        QStringLiteral("^(0(\\.[0-9]+)?|1(\\.0+)?|\\.[0-9]+)$"));
    const QString trimmed = value.trimmed();
    if (!kPattern.match(trimmed).hasMatch()) {
        setError(error, ErrorKind::Validation, kStep,
                 QStringLiteral("confidence must be a decimal from 0.0 to 1.0, got '%1'")
                     .arg(trimmed.left(32)));
        return std::nullopt;
    }
    bool ok = false;
    const double parsed = trimmed.toDouble(&ok);
    if (!ok || parsed < 0.0 || parsed > 1.0) {
        setError(error, ErrorKind::Validation, kStep,
                 QStringLiteral("confidence out of range: '%1'").arg(trimmed));
        return std::nullopt;
    }
    return parsed;
}

QString Sanitizer::hashToken(const QString& seed, int length)
{
    const QByteArray digest =
        QCryptographicHash::hash(seed.toUtf8(), QCryptographicHash::Sha256).toHex();
    return QString::fromLatin1(digest.left(length));
}

QString Sanitizer::slugify(const QString& value, int maxLength, const QString& fallbackSeed)
{
    const QString lowered = value.toLower();

    QString slug;
    slug.reserve(lowered.size());
    for (const QChar ch : lowered) {
        const ushort code = ch.unicode();
        if ((code >= 'a' && code <= 'z') || (code >= '0' && code <= '9')) {
            slug.append(ch);
        } else if (ch.isSpace() || code == '-') {
            if (!slug.isEmpty() && slug.back() != QLatin1Char('-')) {
                slug.append(QLatin1Char('-'));
            }
        }
        // Everything else ('.', '/', '\\', NUL, non-ASCII) is dropped.
    }

    if (slug.size() > maxLength) {
        slug.truncate(maxLength);
    }
    while (slug.endsWith(QLatin1Char('-'))) {
        slug.chop(1);
    }

    if (slug.isEmpty()) {
        return QStringLiteral("h") + hashToken(fallbackSeed);
    }
    if (isWindowsDeviceName(slug)) {
        slug.append(QStringLiteral("-x"));
    }
    return slug;
}

std::optional<LearningRecord> Sanitizer::sanitizeRecord(const RecordInput& input,
                                                        const QDateTime& createdAt,
                                                        WriteError* error)
{
    const auto type = learningTypeFromString(input.type);
    if (!type.has_value()) {
        setError(error, ErrorKind::Validation, kStep,
                 QStringLiteral("type must be one of failure, success, heuristic, experiment; got '%1'")
                     .arg(input.type.left(32)));
        return std::nullopt;
    }

    LearningRecord record;
    record.type = *type;
    record.createdAt = createdAt.toUTC();

    auto domain = sanitize(Field::Domain, input.domain, record.type, error);
    if (!domain.has_value()) {
        return std::nullopt;
    }
    auto title = sanitize(Field::Title, input.title, record.type, error);
    if (!title.has_value()) {
        return std::nullopt;
    }
    auto summary = sanitize(Field::Summary, input.summary, record.type, error);
    if (!summary.has_value()) {
        return std::nullopt;
    }

    QStringList tags;
    for (const QString& rawTag : input.tags) {
        auto tag = sanitize(Field::Tag, rawTag, record.type, error);
        if (!tag.has_value()) {
            return std::nullopt;
        }
        // Commas separate tags in the index column.
        const QString cleanedTag = tag->remove(QLatin1Char(',')).trimmed();
        if (!cleanedTag.isEmpty() && !tags.contains(cleanedTag)) {
            tags.append(cleanedTag);
        }
    }
    if (tags.join(QLatin1Char(',')).size() > kMaxTagsJoinedLength) {
        setError(error, ErrorKind::Validation, kStep,
                 QStringLiteral("tags exceed maximum combined length (%1 characters)")
                     .arg(kMaxTagsJoinedLength));
        return std::nullopt;
    }

    if (record.isHeuristic()) {
        if (!input.severity.trimmed().isEmpty()) {
            setError(error, ErrorKind::Validation, kStep,
                     QStringLiteral("heuristics take a confidence, not a severity"));
            return std::nullopt;
        }
        const QString rawConfidence = input.confidence.trimmed().isEmpty()
                                          ? QStringLiteral("0.7")
                                          : input.confidence;
        auto confidence = parseConfidence(rawConfidence, error);
        if (!confidence.has_value()) {
            return std::nullopt;
        }
        record.confidence = *confidence;

        if (!input.source.trimmed().isEmpty()) {
            auto source = heuristicSourceFromString(input.source);
            if (!source.has_value()) {
                setError(error, ErrorKind::Validation, kStep,
                         QStringLiteral("source must be failure, success or observation; got '%1'")
                             .arg(input.source.left(32)));
                return std::nullopt;
            }
            record.source = *source;
        }
    } else {
        if (!input.confidence.trimmed().isEmpty()) {
            setError(error, ErrorKind::Validation, kStep,
                     QStringLiteral("%1 records take a severity, not a confidence")
                         .arg(learningTypeToString(record.type)));
            return std::nullopt;
        }
        const QString rawSeverity = input.severity.trimmed().isEmpty()
                                        ? QStringLiteral("3")
                                        : input.severity;
        auto severity = parseSeverity(rawSeverity, error);
        if (!severity.has_value()) {
            return std::nullopt;
        }
        record.severity = *severity;
    }

    record.domain = *domain;
    record.title = *title;
    record.summary = *summary;
    record.tags = tags;

    const QString seed = QStringLiteral("%1|%2|%3|%4")
                             .arg(learningTypeToString(record.type),
                                  input.title,
                                  input.summary,
                                  QString::number(record.createdAt.toMSecsSinceEpoch()));
    record.domainSlug = slugify(record.domain, kMaxDomainLength,
                                QStringLiteral("domain|") + input.domain);
    record.titleSlug = slugify(record.title, kMaxTitleSlugLength, seed);

    return record;
}

} // namespace elf
