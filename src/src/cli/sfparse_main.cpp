// sfparse - parse an HTTP structured field value and print it
// as fixture JSON or in canonical form

#include <sf/sfparse.h>
#include <sf/cli/cli_args.h>

#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Each line of the file is one occurrence of the field.
std::vector<std::string> readFieldLines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

// Repeated field lines are combined the way HTTP combines them.
std::string combineFieldLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += ", ";
        out += lines[i];
    }
    return out;
}

void showHelp() {
    std::cout << "sfparse - Parse HTTP structured field values (RFC 8941)\n\n";
    std::cout << "Usage:\n";
    std::cout << "  sfparse [--item|--list|--dictionary] [--json|--serialize] [-v] <value>...\n";
    std::cout << "  sfparse [--item|--list|--dictionary] [--json|--serialize] [-v] --file <path>\n\n";
    std::cout << "Field type:\n";
    std::cout << "  --item               Parse a single item (default)\n";
    std::cout << "  --list               Parse a list\n";
    std::cout << "  --dictionary         Parse a dictionary\n\n";
    std::cout << "Output:\n";
    std::cout << "  --json               Print the fixture JSON form (default)\n";
    std::cout << "  --serialize          Print the canonical serialization\n\n";
    std::cout << "Options:\n";
    std::cout << "  --file, -f <path>    Read field lines from a file, one per line\n";
    std::cout << "  --verbose, -v        Describe the input and any error on stderr\n";
    std::cout << "  --help, -h           Show this message\n\n";
    std::cout << "Several values (or file lines) are joined with \", \" before parsing.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  sfparse --dictionary 'a=1, b=2;x, c=(1 2 3)'\n";
    std::cout << "  sfparse --list --serialize '1,2' '3'\n";
    std::cout << "  sfparse -- '-42'\n";
}

}  // namespace

int main(int argc, const char* argv[]) {
    using sf::cli::CliArgs;

    std::optional<CliArgs> parsed;
    try {
        parsed.emplace(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "run 'sfparse --help' for usage\n";
        return 2;
    }
    const CliArgs& args = *parsed;

    if (args.getAction() == CliArgs::Action::HELP) {
        showHelp();
        return 0;
    }

    std::string input;
    try {
        input = combineFieldLines(args.hasFile() ? readFieldLines(args.getFilePath()) : args.getValues());
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    if (args.isVerbose()) {
        std::cerr << "parsing " << sf::cli::to_string(args.getFieldType()) << " field (" << input.size()
                  << " bytes): " << input << "\n";
    }

    try {
        std::string out;
        sf::Parser parser(input);
        switch (args.getFieldType()) {
            case CliArgs::FieldType::ITEM: {
                sf::Item item = parser.parseItemField();
                out = args.getOutput() == CliArgs::Output::JSON ? sf::to_json(item) : sf::dump_item(item);
                break;
            }
            case CliArgs::FieldType::LIST: {
                sf::List list = parser.parseListField();
                if (args.isVerbose()) std::cerr << "parsed " << list.size() << " list members\n";
                out = args.getOutput() == CliArgs::Output::JSON ? sf::to_json(list) : sf::dump_list(list);
                break;
            }
            case CliArgs::FieldType::DICTIONARY: {
                sf::Dictionary dict = parser.parseDictionaryField();
                if (args.isVerbose()) std::cerr << "parsed " << dict.size() << " dictionary members\n";
                out = args.getOutput() == CliArgs::Output::JSON ? sf::to_json(dict) : sf::dump_dictionary(dict);
                break;
            }
        }
        std::cout << out << "\n";
        return 0;
    } catch (const sf::ParseError& e) {
        if (args.isVerbose()) {
            std::cerr << "failed with " << sf::to_string(e.kind()) << " at offset " << e.offset() << "\n";
        }
        std::cerr << "parse error: " << e.what() << "\n";
        return 1;
    } catch (const sf::SerializeError& e) {
        std::cerr << "serialize error: " << e.what() << "\n";
        return 1;
    }
}
