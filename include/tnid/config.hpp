#pragma once

#include <tnid/encryption.hpp>
#include <tnid/filter.hpp>
#include <tnid/log.hpp>
#include <tnid/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tnid {

// Layered configuration: global (~/.tnid/config.toml) < local file.
//
//   [log]
//   level = "debug"
//   color = false
//
//   [encryption]
//   key = "000102030405060708090a0b0c0d0e0f"
//
//   [filter]
//   blocklist = ["TACO", "FOO"]
struct Config {
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;
    std::optional<std::string> encryption_key_hex;
    std::vector<std::string> blocklist;
    bool blocklist_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; source names the file in error locations
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& source = "");

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Pushes log level/color into tnid::log.
    void apply_logging() const;

    // Config error when no key is configured.
    Result<EncryptionKey> encryption_key() const;
    Result<Blocklist> make_blocklist() const;
};

// Discover the global config file path: ~/.tnid/config.toml
std::string global_config_path();

} // namespace tnid
