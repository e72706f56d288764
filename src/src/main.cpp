// jvtype - report the JSON type of a document and optionally decode it
// through a Payload that accepts only the listed types

#include <jv/jvariant.h>
#include <jv/cli_args.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

namespace {

std::string readInput(const std::string& path) {
    if (path == "-") {
        return std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void showHelp() {
    std::cout << "jvtype - JSON type sniffer and variant decoder\n\n";
    std::cout << "Usage:\n";
    std::cout << "  jvtype <file|->\n";
    std::cout << "  jvtype <file|-> --accept <types> [--number <int|uint|float>] [--pretty <n>]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --accept, -a <types>   Decode, accepting a comma-separated list of\n";
    std::cout << "                         object,array,null,string,number,boolean or all\n";
    std::cout << "  --number, -n <map>     Decode numbers as int (default), uint or float\n";
    std::cout << "  --pretty, -p <n>       Indent the decoded value by n spaces\n";
    std::cout << "  --verbose, -v          Log each step to stderr\n";
    std::cout << "  --help, -h             Show this message\n\n";
    std::cout << "Output:\n";
    std::cout << "  <type>                     without --accept\n";
    std::cout << "  <type> <mapping> <value>   with --accept\n\n";
    std::cout << "Examples:\n";
    std::cout << "  jvtype response.json\n";
    std::cout << "  echo '[1,2]' | jvtype - --accept object,array\n";
    std::cout << "  jvtype count.json -a number -n uint\n";
}

} // namespace

int main(int argc, const char* argv[]) {
    try {
        jv::cli::CliArgs args(argc, argv);

        if (args.getAction() == jv::cli::CliArgs::Action::HELP) {
            showHelp();
            return 0;
        }

        const bool verbose = args.isVerbose();
        std::string content = readInput(args.getInputPath());
        if (verbose) {
            std::cerr << "[jvtype] read " << content.size() << " bytes from " << args.getInputPath() << "\n";
        }

        jv::JsonType type = jv::type_of(content);
        if (verbose) std::cerr << "[jvtype] sniffed type: " << type << "\n";

        if (args.getAction() == jv::cli::CliArgs::Action::SNIFF) {
            std::cout << type << "\n";
            return 0;
        }

        jv::Payload payload;
        args.configure(payload);
        if (verbose) {
            std::cerr << "[jvtype] accepting:";
            for (auto t : args.getAccepted()) std::cerr << " " << t;
            std::cerr << " (numbers as " << args.getNumberMapping() << ")\n";
        }

        payload.decode(content);
        auto [data, mapping] = payload.get();
        if (verbose) std::cerr << "[jvtype] decoded into mapping: " << mapping << "\n";

        std::cout << payload.jsonType() << " " << mapping << " "
                  << jv::to_json(data).dump(args.getIndent()) << "\n";
        return 0;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Run 'jvtype --help' for usage.\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
