#include <jv/cli_args.h>
#include <jv/cli_utils.h>
#include <stdexcept>
#include <string>

namespace jv {
namespace cli {

namespace {
    const std::vector<JsonType> kAllTypes = {
        JsonType::Object, JsonType::Array, JsonType::Null,
        JsonType::String, JsonType::Number, JsonType::Boolean
    };
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    // Valid options for error suggestions
    static const std::vector<std::string> valid_options = {
        "--accept", "-a",
        "--number", "-n",
        "--pretty", "-p",
        "--verbose", "-v",
        "--help", "-h"
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
            return;
        }
        else if (arg == "--accept" || arg == "-a") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--accept requires a list of JSON types");
            }
            parseAccept(argv[++i]);
        }
        else if (arg == "--number" || arg == "-n") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--number requires one of int, uint, float");
            }
            parseNumber(argv[++i]);
        }
        else if (arg == "--pretty" || arg == "-p") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--pretty requires an indent width");
            }
            std::string width = argv[++i];
            if (width.empty() || width.find_first_not_of("0123456789") != std::string::npos || width.size() > 2) {
                throw std::invalid_argument("--pretty requires an indent width between 0 and 99, got '" + width + "'");
            }
            indent_ = std::stoi(width);
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose_ = true;
        }
        else if (arg == "-" || arg.empty() || arg[0] != '-') {
            if (!inputPath_.empty()) {
                throw std::invalid_argument("unexpected argument: " + arg + " (input already set to " + inputPath_ + ")");
            }
            inputPath_ = arg;
        }
        else {
            throw std::invalid_argument(cli_utils::unknown_word_error("Unknown argument", arg, valid_options));
        }
    }

    if (inputPath_.empty()) {
        throw std::invalid_argument("missing input file (use - for standard input)");
    }
    action_ = accepted_.empty() ? Action::SNIFF : Action::DECODE;
}

void CliArgs::parseAccept(const std::string& list) {
    std::vector<std::string> names;
    for (JsonType t : kAllTypes) names.push_back(to_string(t));
    names.push_back("all");

    size_t start = 0;
    while (start <= list.size()) {
        size_t end = list.find(',', start);
        if (end == std::string::npos) end = list.size();
        std::string name = list.substr(start, end - start);
        start = end + 1;

        if (name.empty()) continue;
        if (name == "all") {
            accepted_ = kAllTypes;
            continue;
        }
        bool found = false;
        for (JsonType t : kAllTypes) {
            if (name == to_string(t)) {
                accepted_.push_back(t);
                found = true;
                break;
            }
        }
        if (!found) {
            throw std::invalid_argument(cli_utils::unknown_word_error("Unknown JSON type", name, names));
        }
    }

    if (accepted_.empty()) {
        throw std::invalid_argument("--accept requires at least one JSON type");
    }
}

void CliArgs::parseNumber(const std::string& name) {
    if (name == "int") numberMapping_ = Mapping::Int;
    else if (name == "uint") numberMapping_ = Mapping::Uint;
    else if (name == "float") numberMapping_ = Mapping::Float;
    else throw std::invalid_argument(cli_utils::unknown_word_error("Unknown number mapping", name, {"int", "uint", "float"}));
}

void CliArgs::configure(Payload& payload) const {
    for (JsonType t : accepted_) {
        switch (t) {
            case JsonType::Object: payload.withObject(); break;
            case JsonType::Array: payload.withArray(); break;
            case JsonType::Null: payload.withNull(); break;
            case JsonType::String: payload.withString(); break;
            case JsonType::Boolean: payload.withBoolean(); break;
            case JsonType::Number:
                if (numberMapping_ == Mapping::Uint) payload.withUint();
                else if (numberMapping_ == Mapping::Float) payload.withFloat();
                else payload.withInt();
                break;
            case JsonType::Invalid: break;
        }
    }
}

} // namespace cli
} // namespace jv
