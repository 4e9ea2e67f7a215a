#include "sync/sync_settings.hpp"
#include "sync/sync_log.hpp"

#include <QSettings>
#include <QString>
#include <QtGlobal>

namespace docsync::sync {

namespace {

constexpr auto kSettingsGroup = "sync";
constexpr auto kDebounceMs = "debounceMs";
constexpr auto kIntervalMs = "intervalMs";
constexpr auto kMaxRetries = "maxRetries";
constexpr auto kBackoffCapSeconds = "backoffCapSeconds";
constexpr auto kTombstoneRetentionDays = "tombstoneRetentionDays";
constexpr auto kConflictRetentionDays = "resolvedConflictRetentionDays";
constexpr auto kRemoteNewerMinutes = "autoResolveRemoteNewerMinutes";
constexpr auto kLocalNewerMinutes = "autoResolveLocalNewerMinutes";
constexpr auto kAutoResolve = "autoResolve";
constexpr auto kPullPolicy = "pullPolicy";
constexpr auto kPaused = "paused";
constexpr auto kWifiOnly = "wifiOnly";
constexpr auto kGateTtlMs = "gateCacheTtlMs";

QString key(const char* name) {
    return QString::fromLatin1(name);
}

// Environment override for an integer setting; ignored when unparsable.
void override_ms(const char* var, std::chrono::milliseconds& target) {
    if (!qEnvironmentVariableIsSet(var)) return;
    bool ok = false;
    const auto value = qEnvironmentVariableIntValue(var, &ok);
    if (!ok || value < 0) {
        qCWarning(docsyncSyncLog) << "Ignoring invalid" << var;
        return;
    }
    target = std::chrono::milliseconds(value);
}

void override_flag(const char* var, bool& target) {
    if (!qEnvironmentVariableIsSet(var)) return;
    const auto value = qEnvironmentVariable(var).trimmed().toLower();
    target = value == QLatin1String("1") || value == QLatin1String("true") ||
             value == QLatin1String("yes") || value == QLatin1String("on");
}

std::chrono::milliseconds days(qint64 n) {
    return std::chrono::hours(24 * n);
}

} // namespace

std::string_view to_string(PullPolicy policy) noexcept {
    switch (policy) {
        case PullPolicy::SuppressEchoes: return "suppressEchoes";
        case PullPolicy::SkipAfterUpload: return "skipAfterUpload";
    }
    return "suppressEchoes";
}

std::optional<PullPolicy> parse_pull_policy(std::string_view text) noexcept {
    if (text == "suppressEchoes") return PullPolicy::SuppressEchoes;
    if (text == "skipAfterUpload") return PullPolicy::SkipAfterUpload;
    return std::nullopt;
}

SyncSettings SyncSettings::load() {
    SyncSettings s;
    QSettings settings;
    settings.beginGroup(key(kSettingsGroup));

    s.debounce = std::chrono::milliseconds(
        settings.value(key(kDebounceMs), qint64(s.debounce.count())).toLongLong());
    s.periodic_interval = std::chrono::milliseconds(
        settings.value(key(kIntervalMs), qint64(s.periodic_interval.count())).toLongLong());
    s.retry.max_retries = settings.value(key(kMaxRetries), s.retry.max_retries).toInt();
    s.retry.backoff_cap = std::chrono::seconds(
        settings.value(key(kBackoffCapSeconds), qint64(s.retry.backoff_cap.count())).toLongLong());
    s.tombstone_retention = days(settings.value(key(kTombstoneRetentionDays), 90).toLongLong());
    s.resolved_conflict_retention = days(settings.value(key(kConflictRetentionDays), 7).toLongLong());
    s.auto_resolve_policy.remote_newer_threshold =
        std::chrono::minutes(settings.value(key(kRemoteNewerMinutes), 60).toLongLong());
    s.auto_resolve_policy.local_newer_threshold =
        std::chrono::minutes(settings.value(key(kLocalNewerMinutes), 60).toLongLong());
    s.auto_resolve = settings.value(key(kAutoResolve), false).toBool();
    s.paused = settings.value(key(kPaused), false).toBool();
    s.wifi_only = settings.value(key(kWifiOnly), false).toBool();
    s.gate_cache_ttl = std::chrono::milliseconds(
        settings.value(key(kGateTtlMs), qint64(s.gate_cache_ttl.count())).toLongLong());

    const auto policy_text = settings.value(key(kPullPolicy)).toString().toStdString();
    if (!policy_text.empty()) {
        if (auto policy = parse_pull_policy(policy_text)) {
            s.pull_policy = *policy;
        } else {
            qCWarning(docsyncSyncLog) << "Unknown pull policy" << QString::fromStdString(policy_text);
        }
    }
    settings.endGroup();

    override_ms("DOCSYNC_SYNC_DEBOUNCE_MS", s.debounce);
    override_ms("DOCSYNC_SYNC_INTERVAL_MS", s.periodic_interval);
    override_flag("DOCSYNC_SYNC_PAUSED", s.paused);
    override_flag("DOCSYNC_SYNC_WIFI_ONLY", s.wifi_only);

    if (s.retry.max_retries < 1) s.retry.max_retries = 1;
    return s;
}

void SyncSettings::save() const {
    QSettings settings;
    settings.beginGroup(key(kSettingsGroup));
    settings.setValue(key(kPaused), paused);
    settings.setValue(key(kWifiOnly), wifi_only);
    settings.setValue(key(kAutoResolve), auto_resolve);
    settings.setValue(key(kPullPolicy), QString::fromLatin1(to_string(pull_policy).data()));
    settings.endGroup();
}

} // namespace docsync::sync
