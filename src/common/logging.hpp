#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace histscrub::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

QString newCorrelationId();

// Sets the thread-local correlation id that links every event of one store
// mutation; events logged with an empty id pick it up.
class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace histscrub::logging

#define HSLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::histscrub::logging::logEvent(::histscrub::logging::LogLevel::Debug, \
                                   ::histscrub::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HSLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::histscrub::logging::logEvent(::histscrub::logging::LogLevel::Info, \
                                   ::histscrub::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HSLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::histscrub::logging::logEvent(::histscrub::logging::LogLevel::Warn, \
                                   ::histscrub::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HSLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::histscrub::logging::logEvent(::histscrub::logging::LogLevel::Error, \
                                   ::histscrub::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
