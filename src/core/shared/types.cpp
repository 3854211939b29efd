#include "core/shared/types.h"

namespace elf {

QString learningTypeToString(LearningType type)
{
    switch (type) {
    case LearningType::Failure:    return QStringLiteral("failure");
    case LearningType::Success:    return QStringLiteral("success");
    case LearningType::Heuristic:  return QStringLiteral("heuristic");
    case LearningType::Experiment: return QStringLiteral("experiment");
    }
    return QStringLiteral("failure");
}

std::optional<LearningType> learningTypeFromString(const QString& str)
{
    const QString value = str.trimmed().toLower();
    if (value == QLatin1String("failure"))    return LearningType::Failure;
    if (value == QLatin1String("success"))    return LearningType::Success;
    if (value == QLatin1String("heuristic"))  return LearningType::Heuristic;
    if (value == QLatin1String("experiment")) return LearningType::Experiment;
    return std::nullopt;
}

QString learningTypeDirectory(LearningType type)
{
    switch (type) {
    case LearningType::Failure:    return QStringLiteral("failures");
    case LearningType::Success:    return QStringLiteral("successes");
    case LearningType::Heuristic:  return QStringLiteral("heuristics");
    case LearningType::Experiment: return QStringLiteral("experiments");
    }
    return QStringLiteral("failures");
}

QString heuristicSourceToString(HeuristicSource source)
{
    switch (source) {
    case HeuristicSource::Failure:     return QStringLiteral("failure");
    case HeuristicSource::Success:     return QStringLiteral("success");
    case HeuristicSource::Observation: return QStringLiteral("observation");
    }
    return QStringLiteral("observation");
}

std::optional<HeuristicSource> heuristicSourceFromString(const QString& str)
{
    const QString value = str.trimmed().toLower();
    if (value == QLatin1String("failure"))     return HeuristicSource::Failure;
    if (value == QLatin1String("success"))     return HeuristicSource::Success;
    if (value == QLatin1String("observation")) return HeuristicSource::Observation;
    return std::nullopt;
}

} // namespace elf
