/**
 * @file token_loader.hpp
 * @brief Loading of personal access tokens and PEM keys from files.
 */
#ifndef GITREPOIMPORT_TOKEN_LOADER_HPP
#define GITREPOIMPORT_TOKEN_LOADER_HPP

#include <string>

namespace gri {

/**
 * Load a GitHub access token from a file.
 *
 * JSON, YAML and TOML files may hold a bare string, a `token` key, or a
 * `tokens` list whose first entry is used. Any other extension is read as
 * plain text and the first non-empty line is returned.
 *
 * @param path Filesystem path to the token file.
 * @return The token.
 * @throws std::runtime_error When the file cannot be read or holds no token.
 */
std::string load_token_from_file(const std::string &path);

/**
 * Read a whole file, typically a PEM encoded App private key.
 *
 * @throws std::runtime_error When the file cannot be opened.
 */
std::string read_text_file(const std::string &path);

} // namespace gri

#endif // GITREPOIMPORT_TOKEN_LOADER_HPP
