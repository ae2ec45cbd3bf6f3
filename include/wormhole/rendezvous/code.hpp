#pragma once

#include "wormhole/core/result.hpp"

#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace wormhole::rendezvous {

/**
 * @brief Parsed wormhole code: "<nameplate>-<word>-<word>..."
 *
 * The nameplate routes both parties to the same mailbox; the words are the
 * low-entropy password fed into the key exchange.
 */
struct Code {
    std::string nameplate;
    std::vector<std::string> words;

    [[nodiscard]] std::size_t word_count() const noexcept { return words.size(); }
    [[nodiscard]] std::string password() const;
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Code& other) const {
        return nameplate == other.nameplate && words == other.words;
    }
};

/// Accepts surrounding whitespace and any letter case; rejects unknown words.
wormhole::Result<Code> parse_code(std::string_view text);

Code generate_code(std::string nameplate, std::size_t length, std::mt19937_64& rng);

/// PGP word list. Even positions draw from the two-syllable list, odd from the three-syllable one.
const std::vector<std::string>& even_words();
const std::vector<std::string>& odd_words();
bool is_known_word(std::string_view word);

} // namespace wormhole::rendezvous
