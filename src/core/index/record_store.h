#pragma once

#include "core/shared/types.h"

#include <QString>
#include <cstdint>

namespace elf {

// Raw outcome of one statement against the index. `code` is the SQLite
// primary result code (SQLITE_DONE on success); interpretation (retry,
// ID validation) belongs to the IndexWriter.
struct StoreResult {
    int code = 0;
    int64_t rowId = 0;
    int changes = 0;
    QString message;
};

// RecordStore -- the narrow write surface the IndexWriter needs.
// SQLiteStore is the production implementation; tests substitute
// scripted stores to exercise retry and validation paths.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // Insert one row into the table matching record.type. Must not retry.
    virtual StoreResult insertRecord(const LearningRecord& record) = 0;

    // Delete the row with `id` from the table matching `type`.
    virtual StoreResult deleteRecord(LearningType type, int64_t id) = 0;

    // Fold WAL content into the main database file. False (with the reason)
    // also when frames had to be left in the WAL.
    virtual bool checkpoint(QString* error = nullptr) = 0;

    virtual QString databasePath() const = 0;
};

} // namespace elf
