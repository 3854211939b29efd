#pragma once

#include "core/shared/types.h"

#include <QString>

namespace elf {

// RecordPaths -- deterministic document locations.
//
//   <documentsRoot>/<type dir>/<domain slug>/<YYYYMMDD-HHMMSS>_<title slug>.md
//   ... or <YYYYMMDD-HHMMSS>_<title slug>-<suffix>.md when a suffix is given
//
// Slugs come from the Sanitizer, so no component can contain a separator,
// a dot segment or a NUL. The stored `filepath` is relative to the base
// directory and always uses '/'.
class RecordPaths {
public:
    // `suffix` disambiguates two records that share second and slug.
    static QString fileName(const LearningRecord& record, const QString& suffix = QString());

    // Path relative to the documents root.
    static QString relativeDocumentPath(const LearningRecord& record,
                                        const QString& suffix = QString());

    // Absolute document path under documentsRoot.
    static QString absoluteDocumentPath(const QString& documentsRoot,
                                        const LearningRecord& record,
                                        const QString& suffix = QString());

    // Express `absolutePath` relative to baseDir ('/' separated). Paths
    // outside baseDir are returned cleaned and absolute.
    static QString toStoredPath(const QString& baseDir, const QString& absolutePath);

    // True when `path` is `root` itself or lies beneath it, compared on
    // cleaned absolute paths (no filesystem access).
    static bool isWithin(const QString& root, const QString& path);
};

} // namespace elf
