#include <algorithm>
#include <coderun/config_file.hh>
#include <coderun/file_contents.hh>
#include <coderun/string_transform.hh>

using std::string;

void ConfigFile::load_config_from_file(const string& pathname) {
    load_config_from_string(get_file_contents(pathname));
}

void ConfigFile::load_config_from_string(string config) {
    // Set all variables as unused
    for (auto& [name, var] : vars) {
        var.unset();
    }

    // Checks whether c is a white-space but not a newline
    auto is_ws = [](char c) { return (c != '\n' and is_space(c)); };
    // Checks whether character is one of these [a-zA-Z0-9\-_.]
    auto is_name = [](char c) { return (is_alnum(c) or c == '-' or c == '_' or c == '.'); };

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0;

    auto skip = [&](auto pred) {
        while (pos < config.size() and pred(config[pos])) {
            ++pos;
        }
    };
    auto skip_comment = [&] {
        while (config[pos] != '\n') {
            ++pos;
        }
    };

    auto parse_error = [&](auto&&... args) {
        size_t err_pos = std::min(pos, config.size() - 1);
        size_t line_beg = err_pos;
        while (line_beg > 0 and config[line_beg - 1] != '\n') {
            --line_beg;
        }
        auto line = 1 + std::count(config.begin(), config.begin() + line_beg, '\n');
        size_t col = err_pos - line_beg + 1; // Indexed from 1

        ParseError pe(line, col, std::forward<decltype(args)>(args)...);
        // Construct diagnostics
        auto& diags = pe.diagnostics_;
        size_t marker_pos = 0;
        for (size_t k = line_beg; config[k] != '\n'; ++k) {
            if (k == err_pos) {
                marker_pos = diags.size();
            }
            auto c = static_cast<unsigned char>(config[k]);
            if (c >= 0x20 and c < 0x7f) {
                diags += static_cast<char>(c);
            } else {
                constexpr std::string_view digits = "0123456789abcdef";
                back_insert(diags, "\\x", digits[c >> 4], digits[c & 15]);
            }
        }
        if (config[err_pos] == '\n') {
            marker_pos = diags.size();
        }
        diags += '\n';
        diags.append(marker_pos, ' ');
        diags += '^';
        return pe;
    };

    auto extract_value = [&](bool is_in_array) -> string {
        string res;
        // Single-quoted string
        if (config[pos] == '\'') {
            for (++pos; config[pos] != '\n'; ++pos) {
                if (config[pos] == '\'') {
                    // Safe (newline is at the end of every line)
                    if (config[pos + 1] != '\'') {
                        ++pos;
                        return res;
                    }
                    ++pos;
                }
                res += config[pos];
            }
            throw parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[pos] == '"') {
            for (++pos; config[pos] != '\n'; ++pos) {
                if (config[pos] == '"') {
                    ++pos;
                    return res;
                }
                if (config[pos] != '\\') {
                    res += config[pos];
                    continue;
                }

                // Escape sequence
                switch (config[++pos]) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '?': res += '?'; continue;
                case '\\': res += '\\'; continue;
                case 't': res += '\t'; continue;
                case 'a': res += '\a'; continue;
                case 'b': res += '\b'; continue;
                case 'f': res += '\f'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                case 'v': res += '\v'; continue;
                case 'x':
                    // pos will not go out of the buffer - (guard = newline)
                    for (int i = 0; i < 2; ++i) {
                        if (!is_xdigit(config[++pos])) {
                            throw parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                        }
                    }
                    res += static_cast<char>(
                        (hex2dec(config[pos - 1]) << 4) + hex2dec(config[pos])
                    );
                    continue;
                default: throw parse_error("Unknown escape sequence: `\\", config[pos], '`');
                }
            }
            throw parse_error("Missing terminating \" character");
        }

        // String literal
        auto is_end = [&](char c) {
            return (c == '\n' or c == '#' or (is_in_array and (c == ',' or c == ']')));
        };
        if (config[pos] == '[' or is_end(config[pos])) {
            throw parse_error("Invalid beginning of the string literal: `", config[pos], '`');
        }

        size_t beg = pos;
        while (not is_end(config[pos])) {
            ++pos;
        }
        // Remove white-spaces from ending
        size_t end = pos;
        while (is_space(config[end - 1])) {
            --end;
        }
        return config.substr(beg, end - beg);
    };

    Variable tmp; // Used for ignored variables
    while (pos < config.size()) {
        skip(is_ws);
        // Newline
        if (config[pos] == '\n') {
            ++pos;
            continue;
        }
        // Comment
        if (config[pos] == '#') {
            skip_comment();
            ++pos;
            continue;
        }

        /* Variable name */
        size_t name_beg = pos;
        skip(is_name);
        if (pos == name_beg) {
            throw parse_error("Invalid or missing variable's name");
        }
        string name = config.substr(name_beg, pos - name_beg);

        /* Assignment operator */
        skip(is_ws);
        if (config[pos] == '\n' or config[pos] == '#') {
            throw parse_error("Incomplete directive: `", name, '`');
        }
        if (config[pos] != '=' and config[pos] != ':') {
            throw parse_error("Invalid assignment operator: `", config[pos], '`');
        }
        ++pos;
        skip(is_ws);

        /* Value */
        auto it = vars.find(name);
        Variable& var = (it == vars.end() ? tmp : it->second);
        var.unset();
        var.flag_ = Variable::SET;

        if (config[pos] != '[') { // Normal
            if (config[pos] != '\n' and config[pos] != '#') {
                var.str_ = extract_value(false);
            }
        } else { // Array
            var.flag_ |= Variable::ARRAY;
            ++pos; // Skip [
            for (;;) {
                skip(is_space);
                if (pos >= config.size()) {
                    throw parse_error("Missing terminating ] character at the end of an array");
                }
                if (config[pos] == ']') { // End of the array
                    ++pos;
                    break;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                // Ignore extra delimiters
                if (config[pos] == ',') {
                    ++pos;
                    continue;
                }

                var.arr_.emplace_back(extract_value(true));

                skip(is_ws);
                // Delimiter
                if (config[pos] == ',' or config[pos] == '\n') {
                    ++pos;
                    continue;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                if (config[pos] == ']') {
                    ++pos;
                    break;
                }
                throw parse_error("Invalid character after the array element: `", config[pos], '`');
            }
        }

        /* After the value */
        skip(is_ws);
        if (config[pos] == '#') {
            skip_comment();
        }
        if (config[pos] != '\n') {
            throw parse_error("Unexpected character after the value: `", config[pos], '`');
        }
        ++pos;
    }
}
