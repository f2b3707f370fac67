#include <catch2/catch_test_macros.hpp>

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

// Run a command and capture its output
static std::pair<int, std::string> run_command(const std::string& cmd, bool merge_stderr = true) {
    std::array<char, 128> buffer;
    std::string result;

    std::string full_cmd = cmd + (merge_stderr ? " 2>&1" : " 2>/dev/null");
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

static std::string sfparse(const std::string& args) {
    return std::string("\"") + SFPARSE_BINARY + "\" " + args;
}

TEST_CASE("CLI responds to --help flag", "[cli][help]") {
    auto [exit_code, output] = run_command(sfparse("--help"));

    REQUIRE(exit_code == 0);
    REQUIRE(output.find("sfparse - Parse HTTP structured field values") != std::string::npos);
    REQUIRE(output.find("Usage:") != std::string::npos);
    REQUIRE(output.find("--dictionary") != std::string::npos);
}

TEST_CASE("CLI with no arguments prints help", "[cli][help]") {
    auto [exit_code, output] = run_command(sfparse(""));
    REQUIRE(exit_code == 0);
    REQUIRE(output.find("Usage:") != std::string::npos);
}

TEST_CASE("CLI prints fixture JSON by default", "[cli][json]") {
    auto [exit_code, output] = run_command(sfparse("'42;a=?0'"), false);
    REQUIRE(exit_code == 0);
    REQUIRE(output == "[42,{\"a\":false}]\n");
}

TEST_CASE("CLI parses dictionaries", "[cli][json]") {
    auto [exit_code, output] = run_command(sfparse("--dictionary 'a=1, b;x'"), false);
    REQUIRE(exit_code == 0);
    REQUIRE(output == "{\"a\":[1,{}],\"b\":[true,{\"x\":true}]}\n");
}

TEST_CASE("CLI joins several values into one list", "[cli][serialize]") {
    auto [exit_code, output] = run_command(sfparse("--list --serialize '1,2' ' (a  b)'"), false);
    REQUIRE(exit_code == 0);
    REQUIRE(output == "1, 2, (a b)\n");
}

TEST_CASE("CLI reads field lines from a file", "[cli][file]") {
    const std::string path = "sfparse_cli_fields.txt";
    {
        std::ofstream out(path);
        out << "a=1\r\n";
        out << "b=2, a=3\n";
    }
    auto [exit_code, output] = run_command(sfparse("--dictionary --serialize --file " + path), false);
    std::remove(path.c_str());

    REQUIRE(exit_code == 0);
    REQUIRE(output == "a=3, b=2\n");
}

TEST_CASE("CLI reports parse errors with exit code 1", "[cli][errors]") {
    auto [exit_code, output] = run_command(sfparse("'1.1234'"));
    REQUIRE(exit_code == 1);
    REQUIRE(output.find("parse error") != std::string::npos);
    REQUIRE(output.find("invalid number") != std::string::npos);
}

TEST_CASE("CLI verbose mode describes the failure", "[cli][errors]") {
    auto [exit_code, output] = run_command(sfparse("-v --list '1,'"));
    REQUIRE(exit_code == 1);
    REQUIRE(output.find("parsing list field") != std::string::npos);
    REQUIRE(output.find("at offset") != std::string::npos);
}

TEST_CASE("CLI usage errors exit with code 2", "[cli][errors]") {
    SECTION("unknown flag") {
        auto [exit_code, output] = run_command(sfparse("--dictonary a=1"));
        REQUIRE(exit_code == 2);
        REQUIRE(output.find("Did you mean '--dictionary'?") != std::string::npos);
    }
    SECTION("missing file") {
        auto [exit_code, output] = run_command(sfparse("--file does_not_exist.txt"));
        REQUIRE(exit_code == 2);
        REQUIRE(output.find("Failed to open file") != std::string::npos);
    }
}
