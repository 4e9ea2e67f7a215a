#include "sync/connectivity.hpp"
#include "sync/sync_log.hpp"

#include <QNetworkInformation>

namespace docsync::sync {

std::string_view to_string(Connectivity connectivity) noexcept {
    switch (connectivity) {
        case Connectivity::Offline: return "offline";
        case Connectivity::Wifi: return "wifi";
        case Connectivity::Ethernet: return "ethernet";
        case Connectivity::Cellular: return "cellular";
    }
    return "offline";
}

void ManualConnectivity::set(Connectivity connectivity) {
    if (connectivity == current_) return;
    current_ = connectivity;
    emit changed(current_);
}

NetworkInformationMonitor::NetworkInformationMonitor(QObject* parent)
    : ConnectivityMonitor(parent) {
    has_backend_ = QNetworkInformation::loadDefaultBackend();
    auto* info = QNetworkInformation::instance();
    if (!has_backend_ || info == nullptr) {
        has_backend_ = false;
        qCWarning(docsyncConnectivityLog) << "No QNetworkInformation backend; reporting offline";
        return;
    }

    connect(info, &QNetworkInformation::reachabilityChanged, this, [this]() { refresh(); });
    connect(info, &QNetworkInformation::transportMediumChanged, this, [this]() { refresh(); });
    last_ = current();
}

Connectivity NetworkInformationMonitor::current() const {
    auto* info = QNetworkInformation::instance();
    if (!has_backend_ || info == nullptr) return Connectivity::Offline;

    const auto reachability = info->reachability();
    if (reachability == QNetworkInformation::Reachability::Disconnected) {
        return Connectivity::Offline;
    }
    switch (info->transportMedium()) {
        case QNetworkInformation::TransportMedium::WiFi:
            return Connectivity::Wifi;
        case QNetworkInformation::TransportMedium::Ethernet:
            return Connectivity::Ethernet;
        case QNetworkInformation::TransportMedium::Cellular:
            return Connectivity::Cellular;
        default:
            break;
    }
    // Unknown medium (or a backend that cannot tell): assume a wired link.
    return Connectivity::Ethernet;
}

void NetworkInformationMonitor::refresh() {
    const auto now = current();
    if (now == last_) return;
    qCInfo(docsyncConnectivityLog) << "connectivity" << to_string(last_).data()
                                   << "->" << to_string(now).data();
    last_ = now;
    emit changed(now);
}

} // namespace docsync::sync
