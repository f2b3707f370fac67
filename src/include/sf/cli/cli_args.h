#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sf {
namespace cli {

// Command-line arguments of the sfparse tool
class CliArgs {
  public:
    enum class Action {
        HELP,   // Show help message
        PARSE   // Parse a field value
    };

    enum class FieldType { ITEM, LIST, DICTIONARY };

    enum class Output {
        JSON,      // Conformance fixture JSON (default)
        SERIALIZE  // Canonical structured field text
    };

    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    FieldType getFieldType() const { return fieldType_; }
    Output getOutput() const { return output_; }
    bool isVerbose() const { return verbose_; }
    bool hasFile() const { return filePath_.has_value(); }
    const std::string& getFilePath() const { return *filePath_; }
    const std::vector<std::string>& getValues() const { return values_; }

  private:
    Action action_ = Action::HELP;
    FieldType fieldType_ = FieldType::ITEM;
    Output output_ = Output::JSON;
    bool verbose_ = false;
    std::optional<std::string> filePath_;
    std::vector<std::string> values_;
};

const char* to_string(CliArgs::FieldType type);

}  // namespace cli
}  // namespace sf
