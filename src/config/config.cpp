#include <dspool/config/config.h>

#include <chrono>
#include <fstream>
#include <sstream>

namespace dspool::config {

namespace {

const char* ErrorCodeToString(chjson::error_code code) {
    switch (code) {
        case chjson::error_code::ok: return "ok";
        case chjson::error_code::unexpected_eof: return "unexpected_eof";
        case chjson::error_code::invalid_value: return "invalid_value";
        case chjson::error_code::invalid_number: return "invalid_number";
        case chjson::error_code::invalid_string: return "invalid_string";
        case chjson::error_code::invalid_escape: return "invalid_escape";
        case chjson::error_code::invalid_unicode_escape: return "invalid_unicode_escape";
        case chjson::error_code::invalid_utf16_surrogate: return "invalid_utf16_surrogate";
        case chjson::error_code::expected_colon: return "expected_colon";
        case chjson::error_code::expected_comma_or_end: return "expected_comma_or_end";
        case chjson::error_code::expected_key_string: return "expected_key_string";
        case chjson::error_code::trailing_characters: return "trailing_characters";
        case chjson::error_code::nesting_too_deep: return "nesting_too_deep";
        case chjson::error_code::out_of_memory: return "out_of_memory";
    }
    return "unknown";
}

std::string FormatParseError(const chjson::error& e) {
    std::ostringstream oss;
    oss << "invalid json: " << ErrorCodeToString(e.code)
        << " at line " << e.line << ", col " << e.column;
    return oss.str();
}

dspool::Status KeyError(std::string_view key, const dspool::Status& st) {
    return dspool::Status(st.code(), std::string(key) + ": " + st.message());
}

// Reads an optional key; `apply` runs only when the key is present and well typed.
template <class T, class Getter, class Apply>
dspool::Status ReadOptional(const Config& cfg, std::string_view key, Getter get, Apply apply) {
    if (!cfg.Has(key)) {
        return dspool::Status::Ok();
    }
    dspool::Result<T> r = (cfg.*get)(key);
    if (!r.ok()) {
        return KeyError(key, r.status());
    }
    return apply(r.value());
}

dspool::Status PositiveMillis(std::string_view key, int v, std::chrono::milliseconds& out) {
    if (v <= 0) {
        return dspool::Status(dspool::StatusCode::invalid_argument, std::string(key) + ": must be > 0");
    }
    out = std::chrono::milliseconds(v);
    return dspool::Status::Ok();
}

} // namespace

dspool::Result<Config> Config::Parse(std::string text) {
    auto r = chjson::parse(text);
    if (r.err) {
        return dspool::Status(dspool::StatusCode::invalid_argument, FormatParseError(r.err));
    }

    if (!r.doc.root().is_object()) {
        return dspool::Status(dspool::StatusCode::invalid_argument, "config root must be a JSON object");
    }

    Config c;
    c.doc_ = std::move(r.doc);
    return c;
}

dspool::Result<Config> Config::LoadFile(std::string path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return dspool::Status(dspool::StatusCode::not_found, "config file not found: " + path);
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return Parse(ss.str());
}

bool Config::Has(std::string_view key) const {
    return doc_.root().find(key) != nullptr;
}

dspool::Result<std::string> Config::GetString(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return dspool::Status(dspool::StatusCode::not_found, "missing key");
    }
    if (!v->is_string()) {
        return dspool::Status(dspool::StatusCode::invalid_argument, "not a string");
    }
    return std::string(v->as_string_view());
}

dspool::Result<int> Config::GetInt(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return dspool::Status(dspool::StatusCode::not_found, "missing key");
    }
    if (!v->is_number() || !v->is_int()) {
        return dspool::Status(dspool::StatusCode::invalid_argument, "not an int");
    }
    return static_cast<int>(v->as_int());
}

dspool::Result<bool> Config::GetBool(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return dspool::Status(dspool::StatusCode::not_found, "missing key");
    }
    if (!v->is_bool()) {
        return dspool::Status(dspool::StatusCode::invalid_argument, "not a bool");
    }
    return v->as_bool();
}

dspool::Result<std::vector<std::string>> Config::GetStringList(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return dspool::Status(dspool::StatusCode::not_found, "missing key");
    }
    // a lone string is accepted as a one-element list
    if (v->is_string()) {
        return std::vector<std::string>{std::string(v->as_string_view())};
    }
    if (!v->is_array()) {
        return dspool::Status(dspool::StatusCode::invalid_argument, "not a list of strings");
    }

    std::vector<std::string> out;
    for (const auto& item : v->as_array()) {
        if (!item.is_string()) {
            return dspool::Status(dspool::StatusCode::invalid_argument, "not a list of strings");
        }
        out.emplace_back(item.as_string_view());
    }
    return out;
}

dspool::Result<PoolConfig> LoadPoolConfig(const Config& cfg) {
    PoolConfig pc;
    auto& opt = pc.options;

    dspool::Status st = ReadOptional<std::vector<std::string>>(cfg, "servers", &Config::GetStringList,
        [&](const std::vector<std::string>& v) {
            pc.servers = v;
            return dspool::Status::Ok();
        });
    if (!st.ok()) return st;

    st = ReadOptional<std::string>(cfg, "strategy", &Config::GetString, [&](const std::string& v) {
        auto s = dspool::pool::ParseStrategy(v);
        if (!s.ok()) {
            return s.status();
        }
        opt.strategy = s.value();
        return dspool::Status::Ok();
    });
    if (!st.ok()) return st;

    st = ReadOptional<bool>(cfg, "active", &Config::GetBool, [&](bool v) {
        opt.active_only = v;
        return dspool::Status::Ok();
    });
    if (!st.ok()) return st;

    st = ReadOptional<bool>(cfg, "exhaust", &Config::GetBool, [&](bool v) {
        opt.exhaust_on_failure = v;
        return dspool::Status::Ok();
    });
    if (!st.ok()) return st;

    st = ReadOptional<int>(cfg, "probe_timeout_ms", &Config::GetInt, [&](int v) {
        return PositiveMillis("probe_timeout_ms", v, opt.probe_timeout);
    });
    if (!st.ok()) return st;

    st = ReadOptional<int>(cfg, "backoff_base_ms", &Config::GetInt, [&](int v) {
        return PositiveMillis("backoff_base_ms", v, opt.backoff.base_delay);
    });
    if (!st.ok()) return st;

    st = ReadOptional<int>(cfg, "backoff_max_ms", &Config::GetInt, [&](int v) {
        return PositiveMillis("backoff_max_ms", v, opt.backoff.max_delay);
    });
    if (!st.ok()) return st;

    st = ReadOptional<int>(cfg, "seed", &Config::GetInt, [&](int v) {
        opt.seed = static_cast<std::uint64_t>(v);
        return dspool::Status::Ok();
    });
    if (!st.ok()) return st;

    st = ReadOptional<std::string>(cfg, "log_level", &Config::GetString, [&](const std::string& v) {
        pc.log_level = v;
        return dspool::Status::Ok();
    });
    if (!st.ok()) return st;

    if (opt.exhaust_on_failure && !opt.active_only) {
        return dspool::Status(dspool::StatusCode::invalid_policy,
            "pools can be exhausted only when checking for active servers");
    }
    return pc;
}

dspool::Result<PoolConfig> LoadPoolConfigFile(std::string path) {
    auto cfg = Config::LoadFile(std::move(path));
    if (!cfg.ok()) {
        return cfg.status();
    }
    return LoadPoolConfig(cfg.value());
}

} // namespace dspool::config
