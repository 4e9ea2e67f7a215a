#pragma once

#include <QMetaType>
#include <QObject>
#include <string_view>

namespace docsync::sync {

enum class Connectivity {
    Offline,
    Wifi,
    Ethernet,
    Cellular
};

[[nodiscard]] std::string_view to_string(Connectivity connectivity) noexcept;

[[nodiscard]] constexpr bool is_online(Connectivity c) noexcept {
    return c != Connectivity::Offline;
}

/**
 * ConnectivityMonitor - current network status plus a change signal.
 */
class ConnectivityMonitor : public QObject {
    Q_OBJECT

public:
    explicit ConnectivityMonitor(QObject* parent = nullptr) : QObject(parent) {}

    [[nodiscard]] virtual Connectivity current() const = 0;

signals:
    void changed(docsync::sync::Connectivity connectivity);
};

/**
 * ManualConnectivity - status set by the owner. Used by the CLI (always
 * online), tools and tests.
 */
class ManualConnectivity final : public ConnectivityMonitor {
    Q_OBJECT

public:
    explicit ManualConnectivity(Connectivity initial = Connectivity::Wifi, QObject* parent = nullptr)
        : ConnectivityMonitor(parent), current_(initial) {}

    [[nodiscard]] Connectivity current() const override { return current_; }

    /**
     * Emits changed() only when the value differs.
     */
    void set(Connectivity connectivity);

private:
    Connectivity current_;
};

/**
 * NetworkInformationMonitor - backed by QNetworkInformation. Reports
 * Offline when no backend can be loaded.
 */
class NetworkInformationMonitor final : public ConnectivityMonitor {
    Q_OBJECT

public:
    explicit NetworkInformationMonitor(QObject* parent = nullptr);

    [[nodiscard]] Connectivity current() const override;

    [[nodiscard]] bool hasBackend() const { return has_backend_; }

private:
    bool has_backend_ = false;
    Connectivity last_ = Connectivity::Offline;

    void refresh();
};

} // namespace docsync::sync

Q_DECLARE_METATYPE(docsync::sync::Connectivity)
