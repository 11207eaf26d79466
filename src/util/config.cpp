#include <tnid/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>

namespace tnid {

static TnidError config_error(const std::string& msg, const std::string& source) {
    return TnidError{TnidError::Config, msg, "", source, 0};
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& source) {
    toml::table doc;
    try {
        doc = toml::parse(std::string_view(toml_str), std::string_view(source));
    } catch (const toml::parse_error& e) {
        return TnidError{TnidError::Config,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", source, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    for (auto&& kv : doc) {
        std::string k(kv.first.str());
        if (k != "log" && k != "encryption" && k != "filter") {
            log::debug("ignoring unknown config section '%s'", k.c_str());
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"]) {
            auto s = node.value<std::string>();
            if (!s) {
                return config_error("[log] level must be a string", source);
            }
            auto lvl = log::parse_level(*s);
            if (lvl.is_err()) {
                return TnidError{TnidError::Config, lvl.error().message,
                                 lvl.error().hint, source, 0};
            }
            cfg.log_level = lvl.value();
        }
        if (auto node = (*lg)["color"]) {
            auto b = node.value<bool>();
            if (!b) {
                return config_error("[log] color must be a boolean", source);
            }
            cfg.log_color = *b;
        }
    }

    // [encryption] section
    if (auto enc = doc["encryption"].as_table()) {
        if (auto node = (*enc)["key"]) {
            auto s = node.value<std::string>();
            if (!s) {
                return config_error("[encryption] key must be a string", source);
            }
            auto key = EncryptionKey::from_hex(*s);
            if (key.is_err()) {
                return TnidError{TnidError::Config,
                    "[encryption] key: " + key.error().message,
                    "expected 32 hex characters", source, 0};
            }
            cfg.encryption_key_hex = key.value().to_hex();
        }
    }

    // [filter] section
    if (auto filter = doc["filter"].as_table()) {
        if (auto node = (*filter)["blocklist"]) {
            auto arr = node.as_array();
            if (!arr) {
                return config_error("[filter] blocklist must be an array of strings", source);
            }
            for (const auto& item : *arr) {
                auto s = item.value<std::string>();
                if (!s) {
                    return config_error("[filter] blocklist entries must be strings", source);
                }
                cfg.blocklist.push_back(*s);
            }
            cfg.blocklist_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TnidError{TnidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    log::debug("loading config from %s", path.c_str());
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
    if (other.encryption_key_hex) encryption_key_hex = other.encryption_key_hex;

    // Blocklist: replaced as a whole when set
    if (other.blocklist_set) {
        blocklist = other.blocklist;
        blocklist_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

Result<EncryptionKey> Config::encryption_key() const {
    if (!encryption_key_hex) {
        return TnidError{TnidError::Config,
            "no encryption key configured",
            "set [encryption] key = \"<32 hex chars>\""};
    }
    return EncryptionKey::from_hex(*encryption_key_hex);
}

Result<Blocklist> Config::make_blocklist() const {
    return Blocklist::create(blocklist);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.tnid/config.toml";
}

} // namespace tnid
