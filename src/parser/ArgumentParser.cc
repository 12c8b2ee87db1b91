#include "vault/parser/ArgumentParser.hh"

#include <iomanip>
#include <sstream>

namespace vault {

void ArgumentParser::addArgument(const std::string& name, const std::string& description, bool takesValue) {
    if (lookup(name) != nullptr) {
        throwError("Argument already registered: " + name);
    }
    arguments_.push_back({name, description, takesValue});
}

const ArgumentParser::Argument* ArgumentParser::lookup(const std::string& name) const {
    for (const auto& arg : arguments_) {
        if (arg.name == name)
            return &arg;
    }
    return nullptr;
}

Result<void> ArgumentParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

Result<void> ArgumentParser::parse(const std::vector<std::string>& args) {
    values_.clear();

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto* arg = lookup(args[i]);
        if (arg == nullptr) {
            return Result<void>::error(ErrorCode::InvalidArgument, "Unknown argument: " + args[i]);
        }
        if (!arg->takesValue) {
            values_[arg->name] = "";
            continue;
        }
        if (i + 1 >= args.size()) {
            return Result<void>::error(ErrorCode::InvalidArgument, "Missing value for " + arg->name);
        }
        values_[arg->name] = args[++i];
    }
    return Result<void>::ok();
}

bool ArgumentParser::hasArgument(const std::string& name) const {
    return values_.count(name) > 0;
}

std::optional<std::string> ArgumentParser::value(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end())
        return std::nullopt;
    return it->second;
}

std::string ArgumentParser::usage() const {
    std::ostringstream out;
    for (const auto& arg : arguments_) {
        std::string flag = arg.takesValue ? arg.name + " <value>" : arg.name;
        out << "  " << std::left << std::setw(20) << flag << arg.description << "\n";
    }
    return out.str();
}

} // namespace vault
