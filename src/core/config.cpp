#include "core/config.h"
#include "core/fs.h"
#include "core/logging.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>

namespace core {

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// Split "key=value" (or a bare "key") into trimmed parts.
std::pair<std::string_view, std::string> split_option(std::string_view sv) {
    auto eq = sv.find('=');
    if (eq == std::string_view::npos) {
        return {trim(sv), "1"};
    }
    return {trim(sv.substr(0, eq)), std::string{trim(sv.substr(eq + 1))}};
}

core::Error bad_value(std::string_view key, const std::string& value,
                      const char* what) {
    return core::Error(core::ErrorCode::VALIDATION_ERROR,
        "-" + std::string{key} + "=" + value + " is not " + what);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Sources
// ---------------------------------------------------------------------------

void Config::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty()) continue;

        if (!arg.starts_with("-")) {
            LOG_WARN(core::LogCategory::CONFIG,
                     "ignoring positional argument '" + std::string{arg} + "'");
            continue;
        }
        arg.remove_prefix(arg.starts_with("--") ? 2 : 1);

        auto [key, value] = split_option(arg);
        if (key.empty()) continue;
        auto it = values_.try_emplace(std::string{key}).first;
        it->second.cli.push_back(std::move(value));
    }
}

core::Result<void> Config::parse_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return core::Error(core::ErrorCode::STORAGE_NOT_FOUND,
                           "unable to open config file '" +
                           path.string() + "'");
    }

    LOG_INFO(core::LogCategory::CONFIG,
             "reading options from '" + path.string() + "'");

    std::string line;
    int line_num = 0;
    while (std::getline(ifs, line)) {
        ++line_num;
        std::string_view sv = trim(line);
        if (sv.empty() || sv.front() == '#') continue;

        auto [key, value] = split_option(sv);
        if (key.empty()) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                path.string() + ":" + std::to_string(line_num) +
                ": option has no name");
        }
        auto it = values_.try_emplace(std::string{key}).first;
        it->second.file.push_back(std::move(value));
    }

    return core::make_ok();
}

void Config::set(std::string_view key, std::string value) {
    auto it = values_.try_emplace(std::string{key}).first;
    it->second.file = {std::move(value)};
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

const std::string* Config::first(std::string_view key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return nullptr;
    const auto& vals = it->second.effective();
    return vals.empty() ? nullptr : &vals.front();
}

std::optional<std::string> Config::get(std::string_view key) const {
    const std::string* v = first(key);
    if (!v) return std::nullopt;
    return *v;
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    const std::string* v = first(key);
    if (!v) return default_val;
    for (const char* yes : {"1", "true", "yes", "on"}) {
        if (iequals(*v, yes)) return true;
    }
    for (const char* no : {"0", "false", "no", "off"}) {
        if (iequals(*v, no)) return false;
    }
    return default_val;
}

core::Result<std::optional<uint64_t>> Config::get_u64(
    std::string_view key) const {
    const std::string* v = first(key);
    if (!v) return std::optional<uint64_t>{};

    uint64_t parsed = 0;
    const char* end = v->data() + v->size();
    auto [ptr, ec] = std::from_chars(v->data(), end, parsed);
    if (v->empty() || ec != std::errc{} || ptr != end) {
        return bad_value(key, *v, "an unsigned integer");
    }
    return std::optional<uint64_t>{parsed};
}

core::Result<std::optional<double>> Config::get_double(
    std::string_view key) const {
    const std::string* v = first(key);
    if (!v) return std::optional<double>{};

    double parsed = 0.0;
    try {
        std::size_t pos = 0;
        parsed = std::stod(*v, &pos);
        if (pos != v->size()) {
            return bad_value(key, *v, "a number");
        }
    } catch (const std::logic_error&) {
        // std::invalid_argument or std::out_of_range
        return bad_value(key, *v, "a number");
    }
    if (!std::isfinite(parsed)) {
        return bad_value(key, *v, "a finite number");
    }
    return std::optional<double>{parsed};
}

std::vector<std::string> Config::get_list(std::string_view key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return {};
    std::vector<std::string> out = it->second.cli;
    out.insert(out.end(), it->second.file.begin(), it->second.file.end());
    return out;
}

bool Config::has(std::string_view key) const {
    return first(key) != nullptr;
}

// ---------------------------------------------------------------------------
// Derived values
// ---------------------------------------------------------------------------

std::filesystem::path Config::data_dir() const {
    const std::string* custom = first(CONF_DATADIR);
    std::filesystem::path base = (custom && !custom->empty())
        ? std::filesystem::path{*custom}
        : core::fs::get_default_data_dir();

    std::string net = network();
    if (net == "testnet" || net == "regtest") {
        base /= net;
    }
    return base;
}

std::string Config::network() const {
    const std::string* net = first(CONF_NETWORK);
    if (net && !net->empty()) return *net;
    if (get_bool(CONF_REGTEST)) return "regtest";
    if (get_bool(CONF_TESTNET)) return "testnet";
    return "main";
}

} // namespace core
