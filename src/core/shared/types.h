#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>

namespace elf {

// Kind of learning being recorded. Heuristics live in their own table;
// every other kind is a row in `learnings`.
enum class LearningType {
    Failure,
    Success,
    Heuristic,
    Experiment,
};

QString learningTypeToString(LearningType type);
std::optional<LearningType> learningTypeFromString(const QString& str);

// Directory (relative to the documents root) holding documents of a type.
QString learningTypeDirectory(LearningType type);

// How a heuristic was discovered.
enum class HeuristicSource {
    Failure,
    Success,
    Observation,
};

QString heuristicSourceToString(HeuristicSource source);
std::optional<HeuristicSource> heuristicSourceFromString(const QString& str);

// Raw, untrusted input to record(). Numeric fields stay textual until the
// Sanitizer has matched them against their strict patterns.
struct RecordInput {
    QString type;
    QString domain;
    QString title;
    QString summary;
    QStringList tags;
    QString severity;     // failure / success / experiment
    QString confidence;   // heuristic
    QString source;       // heuristic, optional
};

// A validated learning. `id` stays 0 until the IndexWriter assigns it.
struct LearningRecord {
    int64_t id = 0;
    LearningType type = LearningType::Failure;
    QString domain;        // display form, cleaned
    QString domainSlug;    // filesystem form
    QString title;
    QString titleSlug;
    QString summary;
    QStringList tags;
    int severity = 3;
    double confidence = 0.7;
    HeuristicSource source = HeuristicSource::Observation;
    QString filepath;      // relative to the base directory, '/' separated
    QDateTime createdAt;   // UTC

    bool isHeuristic() const { return type == LearningType::Heuristic; }
};

} // namespace elf
