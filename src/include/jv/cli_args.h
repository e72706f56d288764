#pragma once

#include <jv/json_type.h>
#include <jv/payload.h>
#include <string>
#include <vector>

namespace jv {
namespace cli {

// Parses command-line arguments for the jvtype tool
class CliArgs {
public:
    enum class Action {
        HELP,      // Show help message
        SNIFF,     // Print the JSON type only (default)
        DECODE     // Decode through a Payload accepting the listed types
    };

    // Throws std::invalid_argument on a malformed command line
    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    const std::string& getInputPath() const { return inputPath_; }
    const std::vector<JsonType>& getAccepted() const { return accepted_; }
    Mapping getNumberMapping() const { return numberMapping_; }
    int getIndent() const { return indent_; }
    bool isVerbose() const { return verbose_; }

    // Apply the accepted types and number mapping to a payload
    void configure(Payload& payload) const;

private:
    void parseAccept(const std::string& list);
    void parseNumber(const std::string& name);

    Action action_ = Action::HELP;
    std::string inputPath_;
    std::vector<JsonType> accepted_;
    Mapping numberMapping_ = Mapping::Int;
    int indent_ = 0;
    bool verbose_ = false;
};

} // namespace cli
} // namespace jv
