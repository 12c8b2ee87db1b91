#pragma once

#include "vault/utils/ErrorHandling.hh"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vault {

// Minimal "--flag" / "--option value" command line parser.
class ArgumentParser {
  public:
    void addArgument(const std::string& name, const std::string& description, bool takesValue = false);

    // Unknown arguments and missing values are errors
    Result<void> parse(int argc, char* argv[]);
    Result<void> parse(const std::vector<std::string>& args);

    bool hasArgument(const std::string& name) const;
    std::optional<std::string> value(const std::string& name) const;

    // One line per registered argument, in registration order
    std::string usage() const;

  private:
    struct Argument {
        std::string name;
        std::string description;
        bool takesValue = false;
    };

    const Argument* lookup(const std::string& name) const;

    std::vector<Argument> arguments_;
    std::unordered_map<std::string, std::string> values_;
};

} // namespace vault
