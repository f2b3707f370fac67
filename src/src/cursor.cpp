#include <sf/cursor.h>

namespace sf {

std::string_view ByteCursor::consumeWhile(const std::function<bool(char)>& pred) {
    size_t start = pos_;
    while (pos_ < input_.size() and pred(input_[pos_])) ++pos_;
    return input_.substr(start, pos_ - start);
}

bool ByteCursor::remainingIsOnlyOptionalWhitespace() const noexcept {
    for (size_t k = pos_; k < input_.size(); ++k) {
        if (input_[k] != ' ' and input_[k] != '\t') return false;
    }
    return true;
}

void ByteCursor::skipSpaces() noexcept {
    while (pos_ < input_.size() and input_[pos_] == ' ') ++pos_;
}

void ByteCursor::skipOWS() noexcept {
    while (pos_ < input_.size() and (input_[pos_] == ' ' or input_[pos_] == '\t')) ++pos_;
}

}  // namespace sf
