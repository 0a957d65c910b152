#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace tg {

// Long option accepted by a command (--name or --name <value>)
struct Option {
    std::string name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;
};

// Option values of one invocation, defaults already applied
class Args {
public:
    void set(const std::string& name, const std::string& value) {
        if (!values_.emplace(name, value).second) {
            throw std::runtime_error("Option --" + name + " given more than once");
        }
    }

    bool has(const std::string& name) const {
        return values_.count(name) > 0;
    }

    std::string get(const std::string& name) const {
        auto it = values_.find(name);
        return it != values_.end() ? it->second : std::string();
    }

    std::string require(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            throw std::runtime_error("Missing required option: --" + name);
        }
        return it->second;
    }

    int get_int(const std::string& name, int fallback) const {
        auto it = values_.find(name);
        if (it == values_.end()) return fallback;

        size_t consumed = 0;
        int parsed = 0;
        try {
            parsed = std::stoi(it->second, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != it->second.size()) {
            throw std::runtime_error("--" + name + " expects an integer, got '" + it->second + "'");
        }
        return parsed;
    }

private:
    std::map<std::string, std::string> values_;
};

// Subcommand: name, its own options and the handler returning the exit code
struct Command {
    std::string name;
    std::string description;
    std::vector<Option> options;
    std::function<int(const Args&)> handler;
};

/**
 * @brief Subcommand dispatcher for the threatgraph tool
 *
 * Shared options (database, config file, verbosity) are accepted by every
 * command. Handler exceptions are reported as "Error: ..." with exit code 1.
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void add_shared_option(Option option) {
        shared_.push_back(std::move(option));
    }

    void register_command(Command cmd) {
        commands_[cmd.name] = std::move(cmd);
    }

    int run(int argc, char** argv) {
        if (argc < 2) {
            print_help(std::cerr);
            return 1;
        }

        std::string cmd_name = argv[1];
        if (cmd_name == "--help" || cmd_name == "help") {
            print_help(std::cout);
            return 0;
        }
        if (cmd_name == "--version") {
            std::cout << program_name_ << " " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(cmd_name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd_name << "\n";
            std::cerr << "Run '" << program_name_ << " --help' for available commands.\n";
            return 1;
        }
        const Command& cmd = it->second;

        std::vector<std::string> tokens(argv + 2, argv + argc);
        for (const auto& token : tokens) {
            if (token == "--help") {
                print_command_help(cmd, std::cout);
                return 0;
            }
        }

        Args args;
        try {
            args = parse(tokens, cmd);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            print_command_help(cmd, std::cerr);
            return 1;
        }

        try {
            return cmd.handler(args);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

private:
    const Option* find_option(const Command& cmd, const std::string& name) const {
        for (const auto& option : cmd.options) {
            if (option.name == name) return &option;
        }
        for (const auto& option : shared_) {
            if (option.name == name) return &option;
        }
        return nullptr;
    }

    Args parse(const std::vector<std::string>& tokens, const Command& cmd) const {
        Args args;

        for (size_t i = 0; i < tokens.size(); ++i) {
            const std::string& token = tokens[i];
            if (token.rfind("--", 0) != 0 || token.size() == 2) {
                throw std::runtime_error("Unexpected argument: " + token);
            }

            const Option* option = find_option(cmd, token.substr(2));
            if (!option) {
                throw std::runtime_error("Unknown option: " + token);
            }

            if (option->is_flag) {
                args.set(option->name, "true");
                continue;
            }
            if (i + 1 >= tokens.size() || tokens[i + 1].rfind("--", 0) == 0) {
                throw std::runtime_error("Option " + token + " requires a value");
            }
            args.set(option->name, tokens[++i]);
        }

        auto apply_defaults = [&args](const std::vector<Option>& options) {
            for (const auto& option : options) {
                if (args.has(option.name)) continue;
                if (option.required) {
                    throw std::runtime_error("Missing required option: --" + option.name);
                }
                if (!option.default_value.empty()) {
                    args.set(option.name, option.default_value);
                }
            }
        };
        apply_defaults(cmd.options);
        apply_defaults(shared_);

        return args;
    }

    static void print_options(const std::vector<Option>& options, std::ostream& out) {
        for (const auto& option : options) {
            out << "  --" << option.name << (option.is_flag ? "" : " <value>") << "\n";
            out << "      " << option.description;
            if (!option.default_value.empty()) {
                out << " (default: " << option.default_value << ")";
            }
            if (option.required) {
                out << " [required]";
            }
            out << "\n";
        }
    }

    void print_command_help(const Command& cmd, std::ostream& out) const {
        out << "\nUsage: " << program_name_ << " " << cmd.name;
        for (const auto& option : cmd.options) {
            if (option.required) out << " --" << option.name << " <value>";
        }
        out << " [options]\n\n" << cmd.description << "\n\n";

        out << "Options:\n";
        print_options(cmd.options, out);
        if (!shared_.empty()) {
            out << "\nShared options:\n";
            print_options(shared_, out);
        }
        out << "\n";
    }

    void print_help(std::ostream& out) const {
        out << program_name_ << " - security news knowledge graph\n\n";
        out << "Usage: " << program_name_ << " <command> [options]\n\n";
        out << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            out << "  " << name;
            for (size_t i = name.length(); i < 16; ++i) out << " ";
            out << cmd.description << "\n";
        }
        out << "\nRun '" << program_name_ << " <command> --help' for command options.\n";
    }

    std::string program_name_;
    std::string version_;
    std::vector<Option> shared_;
    std::map<std::string, Command> commands_;
};

} // namespace tg
