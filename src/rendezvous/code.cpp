#include "wormhole/rendezvous/code.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace wormhole::rendezvous {
namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool all_digits(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<std::string_view> split(std::string_view text, char separator) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(separator, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace

std::string Code::password() const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            oss << '-';
        }
        oss << words[i];
    }
    return oss.str();
}

std::string Code::to_string() const {
    if (words.empty()) {
        return nameplate;
    }
    return nameplate + "-" + password();
}

wormhole::Result<Code> parse_code(std::string_view text) {
    const auto trimmed = trim(text);
    if (trimmed.empty()) {
        return wormhole::Err(std::string("code is empty"));
    }

    const auto parts = split(trimmed, '-');
    if (parts.size() < 2) {
        return wormhole::Err(std::string("missing '-' between nameplate and words"));
    }
    if (!all_digits(parts.front())) {
        return wormhole::Err(std::string("nameplate must be numeric"));
    }

    Code code;
    code.nameplate = std::string(parts.front());
    for (std::size_t i = 1; i < parts.size(); ++i) {
        if (parts[i].empty()) {
            return wormhole::Err(std::string("empty word in code"));
        }
        auto word = to_lower(parts[i]);
        if (!is_known_word(word)) {
            return wormhole::Err("unknown word: " + word);
        }
        code.words.push_back(std::move(word));
    }
    return wormhole::Ok(std::move(code));
}

Code generate_code(std::string nameplate, std::size_t length, std::mt19937_64& rng) {
    Code code;
    code.nameplate = std::move(nameplate);
    code.words.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        const auto& list = (i % 2 == 0) ? even_words() : odd_words();
        std::uniform_int_distribution<std::size_t> pick(0, list.size() - 1);
        code.words.push_back(list[pick(rng)]);
    }
    return code;
}

} // namespace wormhole::rendezvous
