#pragma once

#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace conz {

/**
 * A message that is either fixed text or computed from a value.
 *
 * Used for prompt error messages, which may mention the rejected input:
 *
 *   MessageSource<int> msg = [](const int& n) { return std::to_string(n) + " is too small"; };
 *   msg.resolve(3);  // "3 is too small"
 */
template <typename T>
class MessageSource {
public:
    using Formatter = std::function<std::string(const T&)>;

    MessageSource(std::string literal) : source_(std::move(literal)) {}
    MessageSource(const char* literal) : source_(std::string(literal)) {}

    template <typename F,
              typename = std::enable_if_t<std::is_invocable_r_v<std::string, F, const T&>>>
    MessageSource(F formatter) : source_(Formatter(std::move(formatter))) {}

    // Returns the literal text, or the formatter's result for value.
    std::string resolve(const T& value) const {
        if (const auto* literal = std::get_if<std::string>(&source_)) {
            return *literal;
        }
        return std::get<Formatter>(source_)(value);
    }


private:
    std::variant<std::string, Formatter> source_;
};

} // namespace conz
