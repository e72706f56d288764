#include <catch2/catch_test_macros.hpp>

#include <array>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Run a command and capture stdout and stderr together
std::pair<int, std::string> run_command(const std::string& cmd) {
    std::array<char, 128> buffer;
    std::string result;

    std::string full_cmd = cmd + " 2>&1";
    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("popen() failed!");
    }

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result += buffer.data();
    }

    int exit_code = pclose(pipe);
    if (WIFEXITED(exit_code)) {
        exit_code = WEXITSTATUS(exit_code);
    }

    return {exit_code, result};
}

// Scratch directory holding one JSON document per test
class Scratch {
  public:
    Scratch() {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() /
               ("jvtype-" + std::to_string(static_cast<long long>(::getpid())) + "-" +
                std::to_string(static_cast<long long>(now)));
        fs::create_directories(dir_);
    }
    ~Scratch() {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        fs::path p = dir_ / name;
        std::ofstream out(p);
        out << content;
        return p.string();
    }

  private:
    fs::path dir_;
};

const std::string exe = JVTYPE_EXE_PATH;

} // namespace

TEST_CASE("jvtype prints the sniffed type", "[cli][jvtype][integration]") {
    Scratch tmp;

    auto [code, out] = run_command(exe + " " + tmp.write("obj.json", R"({"a":1})"));
    REQUIRE(code == 0);
    REQUIRE(out == "object\n");

    auto [code2, out2] = run_command(exe + " " + tmp.write("num.json", "  -20\n"));
    REQUIRE(code2 == 0);
    REQUIRE(out2 == "number\n");
}

TEST_CASE("jvtype decodes accepted types", "[cli][jvtype][integration]") {
    Scratch tmp;

    SECTION("Composite") {
        auto [code, out] = run_command(exe + " " + tmp.write("obj.json", R"({"b":[1,2], "a":"x"})") +
                                       " --accept object,array");
        REQUIRE(code == 0);
        REQUIRE(out == "object composite {\"a\":\"x\",\"b\":[1,2]}\n");
    }
    SECTION("Number mapping") {
        auto [code, out] = run_command(exe + " " + tmp.write("num.json", "6543") + " -a number -n uint");
        REQUIRE(code == 0);
        REQUIRE(out == "number uint 6543\n");
    }
    SECTION("Standard input") {
        auto [code, out] = run_command("printf 'null' | " + exe + " - -a all");
        REQUIRE(code == 0);
        REQUIRE(out == "null nil null\n");
    }
}

TEST_CASE("jvtype pretty prints the decoded value", "[cli][jvtype][integration]") {
    Scratch tmp;

    auto [code, out] = run_command(exe + " " + tmp.write("arr.json", "[1,2]") + " -a array --pretty 2");
    REQUIRE(code == 0);
    REQUIRE(out == "array composite [\n  1,\n  2\n]\n");
}

TEST_CASE("jvtype exits 1 on a decode error", "[cli][jvtype][integration]") {
    Scratch tmp;

    SECTION("Type not accepted") {
        auto [code, out] = run_command(exe + " " + tmp.write("num.json", "1") + " --accept string,null");
        REQUIRE(code == 1);
        REQUIRE(out.find("Error: unexpected JSON type: number") != std::string::npos);
    }
    SECTION("Malformed document") {
        auto [code, out] = run_command(exe + " " + tmp.write("bad.json", "{\"a\":") + " -a object");
        REQUIRE(code == 1);
        REQUIRE(out.find("unexpected end of input") != std::string::npos);
    }
    SECTION("Unknown content when sniffing") {
        auto [code, out] = run_command(exe + " " + tmp.write("bad.json", "whatever"));
        REQUIRE(code == 1);
        REQUIRE(out.find("Error: unknown type") != std::string::npos);
    }
}

TEST_CASE("jvtype exits 2 on a usage error", "[cli][jvtype][integration]") {
    Scratch tmp;
    std::string file = tmp.write("obj.json", "{}");

    auto [code, out] = run_command(exe + " " + file + " --acept all");
    REQUIRE(code == 2);
    REQUIRE(out.find("Unknown argument: --acept") != std::string::npos);
    REQUIRE(out.find("Did you mean '--accept'?") != std::string::npos);
    REQUIRE(out.find("Run 'jvtype --help' for usage.") != std::string::npos);

    auto [code2, out2] = run_command(exe + " " + file + " -a objct");
    REQUIRE(code2 == 2);
    REQUIRE(out2.find("Did you mean 'object'?") != std::string::npos);
}

TEST_CASE("jvtype shows help", "[cli][jvtype][integration]") {
    auto [code, out] = run_command(exe + " --help");
    REQUIRE(code == 0);
    REQUIRE(out.find("Usage:") != std::string::npos);
    REQUIRE(out.find("--accept") != std::string::npos);

    auto [code2, out2] = run_command(exe);
    REQUIRE(code2 == 0);
    REQUIRE(out2.find("Usage:") != std::string::npos);
}
