#pragma once

#include <string>
#include <string_view>

#include <rpclb/core/status.h>

#include <chjson/chjson.hpp>

namespace rpclb::config {

class Config {
public:
    static rpclb::Result<Config> LoadFile(std::string path);

    // Root must be a JSON object.
    static rpclb::Result<Config> Parse(std::string_view text);

    bool Has(std::string_view key) const;

    rpclb::Result<std::string> GetString(std::string_view key) const;
    rpclb::Result<int> GetInt(std::string_view key) const;

    // A missing key yields def; a present key of the wrong type is still an error.
    rpclb::Result<std::string> GetStringOr(std::string_view key, std::string_view def) const;
    rpclb::Result<int> GetIntOr(std::string_view key, int def) const;

    const chjson::sv_value& raw() const { return doc_.root(); }

private:
    chjson::document doc_;
};

} // namespace rpclb::config
