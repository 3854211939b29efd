#include "core/fs/record_paths.h"

#include <QDir>

namespace elf {

QString RecordPaths::fileName(const LearningRecord& record, const QString& suffix)
{
    const QString stamp = record.createdAt.toUTC().toString(QStringLiteral("yyyyMMdd-HHmmss"));
    if (suffix.isEmpty()) {
        return QStringLiteral("%1_%2.md").arg(stamp, record.titleSlug);
    }
    return QStringLiteral("%1_%2-%3.md").arg(stamp, record.titleSlug, suffix);
}

QString RecordPaths::relativeDocumentPath(const LearningRecord& record, const QString& suffix)
{
    return QStringLiteral("%1/%2/%3")
        .arg(learningTypeDirectory(record.type), record.domainSlug, fileName(record, suffix));
}

QString RecordPaths::absoluteDocumentPath(const QString& documentsRoot,
                                          const LearningRecord& record,
                                          const QString& suffix)
{
    return QDir::cleanPath(
        QDir(documentsRoot).absoluteFilePath(relativeDocumentPath(record, suffix)));
}

QString RecordPaths::toStoredPath(const QString& baseDir, const QString& absolutePath)
{
    const QString cleaned = QDir::cleanPath(absolutePath);
    if (!isWithin(baseDir, cleaned)) {
        return cleaned;
    }
    return QDir::fromNativeSeparators(QDir(QDir::cleanPath(baseDir)).relativeFilePath(cleaned));
}

bool RecordPaths::isWithin(const QString& root, const QString& path)
{
    const QString cleanRoot = QDir::cleanPath(QDir(root).absolutePath());
    const QString cleanPath = QDir::cleanPath(QDir(path).absolutePath());
    if (cleanPath == cleanRoot) {
        return true;
    }
    const QString prefix = cleanRoot.endsWith(QLatin1Char('/')) ? cleanRoot
                                                                 : cleanRoot + QLatin1Char('/');
    return cleanPath.startsWith(prefix);
}

} // namespace elf
