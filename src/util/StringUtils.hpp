#pragma once

#include <string>
#include <vector>

namespace gitminer {

/**
 * @brief Small string helpers shared by the log parsers
 *
 * All functions are pure and byte-oriented; no locale is consulted.
 */
namespace StringUtils {

/**
 * @brief Split text on every occurrence of a (possibly multi-character) delimiter
 *
 * Empty fragments are kept, so "a--b--" split on "--" yields {"a", "b", ""}.
 * An empty input yields a single empty fragment. An empty delimiter yields
 * the whole text as one fragment.
 */
std::vector<std::string> split(const std::string& text, const std::string& delimiter);

/// Split on a single character, keeping empty fragments
std::vector<std::string> split(const std::string& text, char delimiter);

/// Remove every occurrence of ch
std::string removeAll(const std::string& text, char ch);

/// True when text begins with prefix
bool startsWith(const std::string& text, const std::string& prefix);

/// Strip leading and trailing spaces, tabs, CR and LF
std::string trim(const std::string& text);

/// Join parts with separator between consecutive elements
std::string join(const std::vector<std::string>& parts, const std::string& separator);

}

}
