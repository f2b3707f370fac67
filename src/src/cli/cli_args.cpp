#include <sf/cli/cli_args.h>
#include <sf/cli_utils.h>
#include <stdexcept>

namespace sf {
namespace cli {

const char* to_string(CliArgs::FieldType type) {
    switch (type) {
        case CliArgs::FieldType::ITEM: return "item";
        case CliArgs::FieldType::LIST: return "list";
        case CliArgs::FieldType::DICTIONARY: return "dictionary";
    }
    return "item";
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    static const std::vector<std::string> valid_options = {
        "--help", "-h",
        "--item", "--list", "--dictionary",
        "--json", "--serialize",
        "--file", "-f",
        "--verbose", "-v"
    };

    bool typeGiven = false;
    action_ = Action::PARSE;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
            return;
        }
        else if (arg == "--item" || arg == "--list" || arg == "--dictionary") {
            if (typeGiven) {
                throw std::invalid_argument("only one of --item, --list or --dictionary may be given");
            }
            typeGiven = true;
            if (arg == "--list") fieldType_ = FieldType::LIST;
            else if (arg == "--dictionary") fieldType_ = FieldType::DICTIONARY;
            else fieldType_ = FieldType::ITEM;
        }
        else if (arg == "--json") {
            output_ = Output::JSON;
        }
        else if (arg == "--serialize") {
            output_ = Output::SERIALIZE;
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose_ = true;
        }
        else if (arg == "--file" || arg == "-f") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--file requires a path argument");
            }
            filePath_ = argv[++i];
        }
        else if (arg == "--") {
            // everything after -- is a field value, even if it starts with '-'
            for (++i; i < argc; ++i) values_.push_back(argv[i]);
        }
        else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            throw std::invalid_argument(cli_utils::unknown_option_message(arg, valid_options));
        }
        else {
            values_.push_back(arg);
        }
    }

    if (filePath_ && !values_.empty()) {
        throw std::invalid_argument("give either --file or field values, not both");
    }
    if (!filePath_ && values_.empty()) {
        throw std::invalid_argument("no field value given");
    }
}

}  // namespace cli
}  // namespace sf
