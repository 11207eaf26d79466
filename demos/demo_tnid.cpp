// demo_tnid.cpp
//
// Generates a TNID, prints both encodings, and runs it through the
// V0 -> V1 -> V0 encryption round trip using the configured key.
//
//     ./demo_tnid user                 # uses ~/.tnid/config.toml if present
//     ./demo_tnid user tnid.toml       # local config on top of the global one
//     ./demo_tnid USER                 # bad name -> InvalidCharacter
//
// A key is required; put one in the config:
//
//     [encryption]
//     key = "000102030405060708090a0b0c0d0e0f"

#include <tnid/config.hpp>
#include <tnid/encryption.hpp>
#include <tnid/filter.hpp>
#include <tnid/log.hpp>
#include <tnid/tnid.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace tnid;

// Global config first, then the file named on the command line.
Result<Config> load_config(int argc, char** argv) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        TNID_TRY_ASSIGN(global, Config::load(global_path));
    }

    std::optional<Config> local;
    if (argc >= 3) {
        TNID_TRY_ASSIGN(local, Config::load(argv[2]));
    }

    return Result<Config>::ok(Config::effective(global, local));
}

Result<Name> parse_args(int argc, char** argv) {
    if (argc < 2) {
        return TnidError{
            TnidError::InvalidArg,
            "no type name specified",
            "usage: demo_tnid <name> [config.toml]"
        };
    }
    return Name::parse(argv[1]);
}

Status run(int argc, char** argv) {
    TNID_TRY_ASSIGN(Config cfg, load_config(argc, argv));
    cfg.apply_logging();

    TNID_TRY_ASSIGN(Name name, parse_args(argc, argv));
    TNID_TRY_ASSIGN(Blocklist blocklist, cfg.make_blocklist());
    TNID_TRY_ASSIGN(EncryptionKey key, cfg.encryption_key());

    log::debug("blocklist has %zu patterns", blocklist.patterns().size());

    TNID_TRY_ASSIGN(Tnid id, new_v0_filtered(name, blocklist));
    std::cout << "v0:        " << id.to_string() << "\n";
    std::cout << "uuid:      " << id.to_uuid_string() << "\n";

    TNID_TRY_ASSIGN(Tnid encrypted, encrypt_v0_to_v1(id, key));
    std::cout << "encrypted: " << encrypted.to_string() << "\n";
    std::cout << "uuid:      " << encrypted.to_uuid_string(Case::Upper) << "\n";

    TNID_TRY_ASSIGN(Tnid decrypted, decrypt_v1_to_v0(encrypted, key));
    TNID_TRY_ASSIGN(V0Fields fields, decrypted.v0_fields());
    std::cout << "decrypted: " << decrypted.to_string()
              << " (timestamp " << fields.timestamp_ms << " ms)\n";

    if (decrypted != id) {
        return TnidError{TnidError::InvalidArg, "round trip changed the id"};
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        log::error("demo failed");
        std::cerr << "\n" << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
