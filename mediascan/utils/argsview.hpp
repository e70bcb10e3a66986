/*
 * argsview.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Command line argument parser

**************************************************/

#ifndef MEDIASCAN_UTILS_ARGSVIEW_HPP
#define MEDIASCAN_UTILS_ARGSVIEW_HPP

#include <any>
#include <charconv>
#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "mediascan/error/exception.hpp"

namespace mediascan::utils {

class ArgumentError : public mediascan::error::Exception {
public:
    using Exception::Exception;
};

#define THROW_ARGUMENT_ERROR(...)                                          \
    throw mediascan::utils::ArgumentError(MEDIASCAN_FILE_NAME,             \
                                          MEDIASCAN_FILE_LINE,             \
                                          MEDIASCAN_FUNC_NAME, __VA_ARGS__)

/**
 * @class ArgumentParser
 * @brief Parses `--name value` options, `--flag` switches and positional
 * arguments.
 */
class ArgumentParser {
public:
    /**
     * @enum ArgType
     * @brief Type a value is converted to while parsing.
     */
    enum class ArgType { STRING, LONG, FILEPATH, AUTO };

    ArgumentParser() = default;
    explicit ArgumentParser(std::string program_name)
        : programName_(std::move(program_name)) {}

    void setDescription(const std::string& description) {
        description_ = description;
    }

    /**
     * @brief Registers an option taking one value.
     *
     * @param name Long name, used as `--name`.
     * @param type Conversion applied to the value; AUTO follows the default.
     * @param default_value Returned by get() when the option is absent.
     * @param is_positional Also fill it from the first unclaimed bare word.
     */
    void addArgument(const std::string& name, ArgType type = ArgType::AUTO,
                     const std::any& default_value = {},
                     const std::string& help = "",
                     bool is_positional = false);

    void addFlag(const std::string& name, const std::string& help = "",
                 const std::vector<std::string>& aliases = {});

    /**
     * @brief Parses @p argv, the program name included.
     *
     * @throws ArgumentError on unknown options, missing or malformed values
     * and surplus positional arguments.
     */
    void parse(std::span<const std::string> argv);

    template <typename T>
    [[nodiscard]] auto get(const std::string& name) const -> std::optional<T>;

    /// Whether a value for @p name was given on the command line.
    [[nodiscard]] auto isSet(const std::string& name) const -> bool;

    [[nodiscard]] auto getFlag(const std::string& name) const -> bool;

    void printHelp(std::ostream& out) const;

private:
    struct Argument {
        ArgType type{ArgType::STRING};
        std::any defaultValue;
        std::optional<std::any> value;
        std::string help;
        bool is_positional{false};
    };

    struct Flag {
        bool value{false};
        std::string help;
        std::vector<std::string> aliases;
    };

    std::map<std::string, Argument> arguments_;
    std::map<std::string, Flag> flags_;
    std::map<std::string, std::string> aliases_;
    std::vector<std::string> positionalOrder_;
    std::string programName_;
    std::string description_;

    static auto detectType(const std::any& value) -> ArgType;
    static auto parseValue(ArgType type, const std::string& name,
                           const std::string& value) -> std::any;
    static auto anyToString(const std::any& value) -> std::string;
};

inline void ArgumentParser::addArgument(const std::string& name, ArgType type,
                                        const std::any& default_value,
                                        const std::string& help,
                                        bool is_positional) {
    if (name.empty()) {
        THROW_ARGUMENT_ERROR("Argument name cannot be empty");
    }
    if (type == ArgType::AUTO) {
        type = default_value.has_value() ? detectType(default_value)
                                         : ArgType::STRING;
    }
    arguments_[name] = Argument{type, default_value, std::nullopt, help,
                                is_positional};
    if (is_positional) {
        positionalOrder_.push_back(name);
    }
}

inline void ArgumentParser::addFlag(const std::string& name,
                                    const std::string& help,
                                    const std::vector<std::string>& aliases) {
    if (name.empty()) {
        THROW_ARGUMENT_ERROR("Flag name cannot be empty");
    }
    flags_[name] = Flag{false, help, aliases};
    for (const auto& alias : aliases) {
        aliases_[alias] = name;
    }
}

inline void ArgumentParser::parse(std::span<const std::string> argv) {
    std::vector<std::string> positional;
    for (std::size_t i = 1; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }

        std::string argName =
            arg.starts_with("--") ? arg.substr(2) : arg.substr(1);
        std::optional<std::string> inlineValue;
        if (auto eq = argName.find('='); eq != std::string::npos) {
            inlineValue = argName.substr(eq + 1);
            argName.resize(eq);
        }
        if (auto alias = aliases_.find(argName); alias != aliases_.end()) {
            argName = alias->second;
        }

        if (auto flag = flags_.find(argName); flag != flags_.end()) {
            if (inlineValue) {
                THROW_ARGUMENT_ERROR("Flag --", argName, " takes no value");
            }
            flag->second.value = true;
            continue;
        }

        auto found = arguments_.find(argName);
        if (found == arguments_.end()) {
            THROW_ARGUMENT_ERROR("Unknown argument: ", arg);
        }
        if (!inlineValue) {
            if (i + 1 >= argv.size()) {
                THROW_ARGUMENT_ERROR("Argument --", argName,
                                     " expects a value");
            }
            inlineValue = argv[++i];
        }
        found->second.value =
            parseValue(found->second.type, argName, *inlineValue);
    }

    std::size_t next = 0;
    for (const auto& value : positional) {
        while (next < positionalOrder_.size() &&
               arguments_.at(positionalOrder_[next]).value) {
            ++next;
        }
        if (next == positionalOrder_.size()) {
            THROW_ARGUMENT_ERROR("Unexpected positional argument: ", value);
        }
        auto& argument = arguments_.at(positionalOrder_[next]);
        argument.value =
            parseValue(argument.type, positionalOrder_[next], value);
    }
}

template <typename T>
auto ArgumentParser::get(const std::string& name) const -> std::optional<T> {
    auto found = arguments_.find(name);
    if (found == arguments_.end()) {
        return std::nullopt;
    }
    const auto& arg = found->second;
    const std::any& held = arg.value ? *arg.value : arg.defaultValue;
    if (!held.has_value()) {
        return std::nullopt;
    }
    if (const T* value = std::any_cast<T>(&held)) {
        return *value;
    }
    return std::nullopt;
}

inline auto ArgumentParser::isSet(const std::string& name) const -> bool {
    auto found = arguments_.find(name);
    return found != arguments_.end() && found->second.value.has_value();
}

inline auto ArgumentParser::getFlag(const std::string& name) const -> bool {
    auto found = flags_.find(name);
    return found != flags_.end() && found->second.value;
}

inline void ArgumentParser::printHelp(std::ostream& out) const {
    out << "Usage:\n  " << programName_ << " [options]";
    for (const auto& name : positionalOrder_) {
        out << " [" << name << "]";
    }
    out << "\n\n";
    if (!description_.empty()) {
        out << description_ << "\n\n";
    }
    out << "Options:\n";
    for (const auto& [name, argument] : arguments_) {
        out << "  --" << name << " : " << argument.help;
        if (argument.defaultValue.has_value()) {
            out << " (default: " << anyToString(argument.defaultValue) << ")";
        }
        out << "\n";
    }
    for (const auto& [name, flag] : flags_) {
        out << "  --" << name;
        for (const auto& alias : flag.aliases) {
            out << ", -" << alias;
        }
        out << " : " << flag.help << "\n";
    }
}

inline auto ArgumentParser::detectType(const std::any& value) -> ArgType {
    if (value.type() == typeid(long)) {
        return ArgType::LONG;
    }
    if (value.type() == typeid(std::filesystem::path)) {
        return ArgType::FILEPATH;
    }
    return ArgType::STRING;
}

inline auto ArgumentParser::parseValue(ArgType type, const std::string& name,
                                       const std::string& value) -> std::any {
    switch (type) {
        case ArgType::LONG: {
            long parsed = 0;
            const char* end = value.data() + value.size();
            auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
            if (ec != std::errc{} || ptr != end) {
                THROW_ARGUMENT_ERROR("Invalid integer for --", name, ": ",
                                     value);
            }
            return parsed;
        }
        case ArgType::FILEPATH:
            return std::filesystem::path(value);
        case ArgType::STRING:
        case ArgType::AUTO:
            break;
    }
    return value;
}

inline auto ArgumentParser::anyToString(const std::any& value)
    -> std::string {
    if (const auto* s = std::any_cast<std::string>(&value)) {
        return *s;
    }
    if (const auto* l = std::any_cast<long>(&value)) {
        return std::to_string(*l);
    }
    if (const auto* p = std::any_cast<std::filesystem::path>(&value)) {
        return p->string();
    }
    return "";
}

}  // namespace mediascan::utils

#endif  // MEDIASCAN_UTILS_ARGSVIEW_HPP
