#include "discovery/FriendlyName.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace lanscout {

namespace {

const std::unordered_map<std::string, std::string>& full_type_labels() {
    static const std::unordered_map<std::string, std::string> table = {
        {"_googlecast._tcp.local.", "Google Cast (Chromecast/Google Home)"},
        {"_hue._tcp.local.", "Philips Hue Bridge"},
        {"_hap._tcp.local.", "Apple HomeKit Accessory (HAP)"},
        {"_airplay._tcp.local.", "Apple AirPlay / AppleTV"},
        {"_spotify-connect._tcp.local.", "Spotify Connect"},
        {"_http._tcp.local.", "HTTP Web Service"},
        {"_https._tcp.local.", "HTTPS Web Service"},
        {"_ssh._tcp.local.", "SSH Service"},
        {"_ipp._tcp.local.", "IPP Printer"},
        {"_printer._tcp.local.", "Network Printer"},
        {"_scanner._tcp.local.", "Network Scanner"},
        {"_amzn-wplay._tcp.local.", "Amazon Fire / Alexa"},
        {"_androidtvremote2._tcp.local.", "Android TV Remote"},
        {"_companion-link._tcp.local.", "Companion Link / Phone Link"},
        {"_carplay-ctrl._tcp.local.", "Apple CarPlay Control"},
        {"_spotify-social-listening._tcp.local.", "Spotify Social Listening"},
        {"_sonos._tcp.local.", "Sonos"},
        {"_matter._tcp.local.", "Matter Smart Home Device"},
    };
    return table;
}

const std::unordered_map<std::string, std::string>& short_name_labels() {
    static const std::unordered_map<std::string, std::string> table = {
        {"googlecast", "Google Cast (Chromecast/Google Home)"},
        {"googlecast-tls", "Google Cast (secure)"},
        {"hue", "Philips Hue Bridge"},
        {"philipshue", "Philips Hue Bridge"},
        {"airplay", "Apple AirPlay / AppleTV"},
        {"airplay2", "Apple AirPlay 2"},
        {"raop", "AirPlay (RAOP)"},
        {"raopv2", "AirPlay (RAOP v2)"},
        {"homekit", "Apple HomeKit Accessory"},
        {"hap", "Apple HomeKit Accessory (HAP)"},
        {"amzn-alexa", "Amazon Alexa / Echo"},
        {"amzn-wplay", "Amazon Fire TV / Alexa Cast"},
        {"sonos", "Sonos Speaker"},
        {"spotify-connect", "Spotify Connect"},
        {"spotify", "Spotify Service"},
        {"roku", "Roku Device"},
        {"androidtv", "Android TV"},
        {"androidtvremote2", "Android TV Remote"},
        {"chromecast", "Chromecast"},
        {"dlna", "DLNA Media Server / Renderer"},
        {"ipp", "IPP Printer"},
        {"printer", "Network Printer"},
        {"pdl-datastream", "Printer (PDL datastream)"},
        {"scanner", "Network Scanner"},
        {"uscan", "Scanner"},
        {"privet", "Cloud Print / Privet Printer"},
        {"home-assistant", "Home Assistant"},
        {"mqtt", "MQTT Broker"},
        {"mqtt-tls", "MQTT Broker (TLS)"},
        {"tplink", "TP-Link Smart Device"},
        {"tplink-https", "TP-Link (HTTPS)"},
        {"aqara-setup", "Aqara Setup / Hub"},
        {"aqara", "Aqara device"},
        {"matter", "Matter Smart Home Device"},
        {"hap-ble", "HAP over BLE (HomeKit)"},
        {"http", "HTTP Web Service"},
        {"https", "HTTPS Web Service"},
        {"ssh", "SSH Service"},
        {"ftp", "FTP Service"},
        {"smb", "SMB / Windows Share"},
        {"afpovertcp", "Apple Filing Protocol (AFP)"},
        {"smbd", "SMB"},
        {"googlezone", "Google Zone / Cast"},
        {"apple-mobdev2", "Apple Mobile Device"},
        {"companion-link", "Companion Link / Phone Link"},
        {"carplay-ctrl", "Apple CarPlay Control"},
        {"http-alt", "Alternate HTTP"},
        {"cros-p2p", "ChromeOS P2P service (Chromebook)"},
    };
    return table;
}

void erase_all(std::string& s, const std::string& needle) {
    for (auto pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos)) {
        s.erase(pos, needle.size());
    }
}

} // namespace

std::string short_service_name(const std::string& service_type) {
    if (service_type.empty()) return {};
    std::string t = service_type;
    if (t[0] == '_') t.erase(0, 1);
    auto sep = t.find("._");
    if (sep != std::string::npos) t.erase(sep);
    erase_all(t, ".local.");
    erase_all(t, ".local");
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return t;
}

std::string friendly_name(const std::string& service_type,
                          const std::map<std::string, std::string>& metadata) {
    const auto& full = full_type_labels();
    if (auto it = full.find(service_type); it != full.end()) return it->second;

    const std::string short_name = short_service_name(service_type);
    const auto& by_short = short_name_labels();
    if (auto it = by_short.find(short_name); it != by_short.end()) return it->second;

    for (const char* key : {"fn", "name"}) {
        auto it = metadata.find(key);
        if (it != metadata.end() && !it->second.empty()) return it->second;
    }
    return short_name + " (service)";
}

} // namespace lanscout
