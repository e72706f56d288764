#include <catch2/catch_test_macros.hpp>
#include <jv/cli_args.h>
#include <jv/cli_utils.h>

#include <stdexcept>
#include <string>

using jv::cli::CliArgs;

namespace {
    // message of the std::invalid_argument thrown while parsing argv
    template <int N>
    std::string cliError(const char* (&argv)[N]) {
        try {
            CliArgs args(N, argv);
        } catch (const std::invalid_argument& e) {
            return e.what();
        }
        return "";
    }
}

TEST_CASE("File only sniffs the type", "[cli_args][unit]") {
    const char* argv[] = {"jvtype", "response.json"};
    int argc = 2;

    CliArgs args(argc, argv);

    REQUIRE(args.getInputPath() == "response.json");
    REQUIRE(args.getAction() == CliArgs::Action::SNIFF);
    REQUIRE(args.getAccepted().empty());
    REQUIRE(args.getIndent() == 0);
    REQUIRE_FALSE(args.isVerbose());
}

TEST_CASE("No arguments shows help", "[cli_args][unit]") {
    const char* argv[] = {"jvtype"};
    int argc = 1;

    CliArgs args(argc, argv);

    REQUIRE(args.getAction() == CliArgs::Action::HELP);
}

TEST_CASE("Help wins over everything else", "[cli_args][unit]") {
    const char* argv[] = {"jvtype", "file.json", "--accept", "all", "-h"};
    int argc = 5;

    CliArgs args(argc, argv);

    REQUIRE(args.getAction() == CliArgs::Action::HELP);
}

TEST_CASE("Dash reads standard input", "[cli_args][unit]") {
    const char* argv[] = {"jvtype", "-", "-v"};
    int argc = 3;

    CliArgs args(argc, argv);

    REQUIRE(args.getInputPath() == "-");
    REQUIRE(args.isVerbose());
}

TEST_CASE("Accept list switches to decoding", "[cli_args][unit]") {
    const char* argv[] = {"jvtype", "file.json", "--accept", "object,array,null"};
    int argc = 4;

    CliArgs args(argc, argv);

    REQUIRE(args.getAction() == CliArgs::Action::DECODE);
    REQUIRE(args.getAccepted() ==
            std::vector<jv::JsonType>{jv::JsonType::Object, jv::JsonType::Array, jv::JsonType::Null});
    REQUIRE(args.getNumberMapping() == jv::Mapping::Int);
}

TEST_CASE("Accept all with short forms", "[cli_args][unit]") {
    const char* argv[] = {"jvtype", "-a", "all", "-n", "float", "-p", "2", "file.json"};
    int argc = 8;

    CliArgs args(argc, argv);

    REQUIRE(args.getInputPath() == "file.json");
    REQUIRE(args.getAccepted().size() == 6);
    REQUIRE(args.getNumberMapping() == jv::Mapping::Float);
    REQUIRE(args.getIndent() == 2);
}

TEST_CASE("Configure a payload from the command line", "[cli_args][unit]") {
    const char* argv[] = {"jvtype", "file.json", "-a", "number,string", "-n", "uint"};
    int argc = 6;

    CliArgs args(argc, argv);
    jv::Payload payload;
    args.configure(payload);

    REQUIRE(payload.accepts(jv::JsonType::Number));
    REQUIRE(payload.accepts(jv::JsonType::String));
    REQUIRE_FALSE(payload.accepts(jv::JsonType::Object));
    payload.decode("5");
    REQUIRE(payload.getUint() == 5u);
    REQUIRE_THROWS_AS(payload.decode("true"), jv::UnexpectedType);
}

TEST_CASE("Malformed command lines", "[cli_args][unit]") {
    SECTION("Missing input") {
        const char* argv[] = {"jvtype", "-a", "all"};
        REQUIRE(cliError(argv) == "missing input file (use - for standard input)");
    }
    SECTION("Two inputs") {
        const char* argv[] = {"jvtype", "a.json", "b.json"};
        REQUIRE(cliError(argv).find("unexpected argument: b.json") != std::string::npos);
    }
    SECTION("Missing option values") {
        const char* accept[] = {"jvtype", "file.json", "--accept"};
        REQUIRE_FALSE(cliError(accept).empty());
        const char* number[] = {"jvtype", "file.json", "--number"};
        REQUIRE_FALSE(cliError(number).empty());
        const char* pretty[] = {"jvtype", "file.json", "--pretty"};
        REQUIRE_FALSE(cliError(pretty).empty());
    }
    SECTION("Empty accept list") {
        const char* argv[] = {"jvtype", "file.json", "--accept", ","};
        REQUIRE(cliError(argv) == "--accept requires at least one JSON type");
    }
    SECTION("Bad indent") {
        const char* argv[] = {"jvtype", "file.json", "--pretty", "-1"};
        REQUIRE(cliError(argv).find("between 0 and 99") != std::string::npos);
        const char* wide[] = {"jvtype", "file.json", "--pretty", "100"};
        REQUIRE_FALSE(cliError(wide).empty());
    }
}

TEST_CASE("Typos get a suggestion", "[cli_args][unit]") {
    SECTION("Option") {
        const char* argv[] = {"jvtype", "file.json", "--acept", "all"};
        std::string error_msg = cliError(argv);
        REQUIRE(error_msg.find("Unknown argument: --acept") != std::string::npos);
        REQUIRE(error_msg.find("Did you mean '--accept'?") != std::string::npos);
    }
    SECTION("JSON type") {
        const char* argv[] = {"jvtype", "file.json", "-a", "objct"};
        std::string error_msg = cliError(argv);
        REQUIRE(error_msg.find("Unknown JSON type: objct") != std::string::npos);
        REQUIRE(error_msg.find("Did you mean 'object'?") != std::string::npos);
    }
    SECTION("Number mapping") {
        const char* argv[] = {"jvtype", "file.json", "-a", "number", "-n", "flot"};
        std::string error_msg = cliError(argv);
        REQUIRE(error_msg.find("Did you mean 'float'?") != std::string::npos);
    }
    SECTION("Nothing close") {
        const char* argv[] = {"jvtype", "file.json", "--completely-different"};
        std::string error_msg = cliError(argv);
        REQUIRE(error_msg.find("Unknown argument") != std::string::npos);
        REQUIRE(error_msg.find("Did you mean") == std::string::npos);
    }
}

TEST_CASE("Edit distance", "[cli_args][unit]") {
    using jv::cli_utils::levenshtein_distance;
    REQUIRE(levenshtein_distance("", "") == 0);
    REQUIRE(levenshtein_distance("abc", "") == 3);
    REQUIRE(levenshtein_distance("kitten", "sitting") == 3);
    REQUIRE(levenshtein_distance("--verbose", "--verbose") == 0);
}
