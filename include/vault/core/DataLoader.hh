#pragma once

#include "vault/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace vault {

// DataLoader: a parsed TOML document with typed, dotted-key accessors
// ("presence.decay_rate"). Every accessor reports a descriptive Result
// error naming the source and key on a missing key or type mismatch.
class DataLoader {
  public:
    // Parse a TOML file from disk.
    static Result<DataLoader> load(const std::filesystem::path& path);

    // Parse TOML text (useful for testing without disk I/O).
    static Result<DataLoader> parse(std::string_view tomlContent, std::string_view sourceName = "string");

    Result<std::string> getString(std::string_view key) const;
    Result<int64_t> getInt(std::string_view key) const;
    // Accepts integer values as well ("speed = 4").
    Result<double> getFloat(std::string_view key) const;
    Result<bool> getBool(std::string_view key) const;

    bool hasKey(std::string_view key) const;

    const toml::table& table() const;
    const std::string& sourceName() const;

  private:
    DataLoader(toml::table tbl, std::string source);

    const toml::node* resolve(std::string_view dottedKey) const;
    std::string formatError(std::string_view key, std::string_view expected) const;

    toml::table table_;
    std::string sourceName_;
};

} // namespace vault
