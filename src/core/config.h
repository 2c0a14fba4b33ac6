#pragma once

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Option names understood by feetier-cli and feetier.conf
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_DATADIR           = "datadir";
inline constexpr const char* CONF_CONF              = "conf";
inline constexpr const char* CONF_NETWORK           = "network";
inline constexpr const char* CONF_TESTNET           = "testnet";
inline constexpr const char* CONF_REGTEST           = "regtest";
inline constexpr const char* CONF_LOGLEVEL          = "loglevel";
inline constexpr const char* CONF_DEBUG             = "debug";
inline constexpr const char* CONF_PRINTTOCONSOLE    = "printtoconsole";
inline constexpr const char* CONF_FEEMETRIC         = "feemetric";
inline constexpr const char* CONF_FEEPCTFAST        = "feepctfast";
inline constexpr const char* CONF_FEEPCTMEDIUM      = "feepctmedium";
inline constexpr const char* CONF_FEEPCTSLOW        = "feepctslow";
inline constexpr const char* CONF_FEEBLENDPRIOR     = "feeblendprior";
inline constexpr const char* CONF_FEEBLENDSAMPLE    = "feeblendsample";
inline constexpr const char* CONF_BLOCKSIZELIMIT    = "blocksizelimit";
inline constexpr const char* CONF_BLOCKWRITELENGTH  = "blockwritelength";
inline constexpr const char* CONF_BLOCKWRITECOUNT   = "blockwritecount";
inline constexpr const char* CONF_BLOCKREADLENGTH   = "blockreadlength";
inline constexpr const char* CONF_BLOCKREADCOUNT    = "blockreadcount";
inline constexpr const char* CONF_BLOCKRUNTIME      = "blockruntime";

// ---------------------------------------------------------------------------
// Config  --  option values from the command line and feetier.conf
//
// Every key carries two layers.  The command-line layer always wins; the
// file layer holds feetier.conf entries and anything set() programmatically.
// A key given several times (-debug=fees -debug=storage) keeps every value
// for get_list(); the scalar getters return the first one.
//
// The typed getters are strict: a value that is present but does not parse
// is a VALIDATION_ERROR, never a silent fallback.
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    /// Accepts -key=value, --key=value and bare -flag (stored as "1").
    /// Positional arguments are logged and ignored.
    void parse_args(int argc, char* argv[]);

    /// key=value per line; '#' starts a comment line; a bare word is a
    /// flag.  STORAGE_NOT_FOUND if the file cannot be opened,
    /// PARSE_BAD_FORMAT for a line with an empty key.
    core::Result<void> parse_file(const std::filesystem::path& path);

    /// Replace the file-layer values of @p key.
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    /// "1", "true", "yes", "on" / "0", "false", "no", "off" in any case;
    /// anything else yields @p default_val.
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Decimal unsigned integer, std::nullopt when the key is absent.
    [[nodiscard]] core::Result<std::optional<uint64_t>> get_u64(
        std::string_view key) const;

    /// Finite decimal number, std::nullopt when the key is absent.
    [[nodiscard]] core::Result<std::optional<double>> get_double(
        std::string_view key) const;

    /// Command-line values followed by file values.
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    /// -datadir (or the platform default) with "testnet" / "regtest"
    /// appended for those networks.
    [[nodiscard]] std::filesystem::path data_dir() const;

    /// -network if given, else "regtest" / "testnet" from the flags, else
    /// "main".
    [[nodiscard]] std::string network() const;

private:
    struct Layers {
        std::vector<std::string> cli;
        std::vector<std::string> file;

        [[nodiscard]] const std::vector<std::string>& effective() const {
            return cli.empty() ? file : cli;
        }
    };

    std::map<std::string, Layers, std::less<>> values_;

    [[nodiscard]] const std::string* first(std::string_view key) const;
};

} // namespace core
