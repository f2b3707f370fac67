#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>

namespace sf {

// Forward-only view over the bytes of a field value. The input is borrowed
// and never modified; it must outlive the cursor.
class ByteCursor {
  public:
    explicit ByteCursor(std::string_view input) noexcept : input_(input) {}

    std::optional<char> peek() const noexcept {
        if (pos_ >= input_.size()) return std::nullopt;
        return input_[pos_];
    }

    std::optional<char> consume() noexcept {
        if (pos_ >= input_.size()) return std::nullopt;
        return input_[pos_++];
    }

    // Consumes bytes while pred holds and returns them as a slice of the input.
    std::string_view consumeWhile(const std::function<bool(char)>& pred);

    bool remainingIsOnlyOptionalWhitespace() const noexcept;

    void skipSpaces() noexcept;  // SP
    void skipOWS() noexcept;     // SP / HTAB

    bool atEnd() const noexcept { return pos_ >= input_.size(); }
    size_t offset() const noexcept { return pos_; }
    std::string_view input() const noexcept { return input_; }

  private:
    std::string_view input_;
    size_t pos_ = 0;
};

}  // namespace sf
