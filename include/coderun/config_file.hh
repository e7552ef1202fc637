#pragma once

#include <coderun/concat_tostr.hh>
#include <coderun/string_transform.hh>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        explicit ParseError(const std::string& msg) : runtime_error(msg) {}

        template <class... Args>
        ParseError(size_t line, size_t pos, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...)) {
        }

        ParseError(const ParseError& pe) = default;
        ParseError(ParseError&&) noexcept = default;
        ParseError& operator=(const ParseError& pe) = default;
        ParseError& operator=(ParseError&&) noexcept = default;

        using runtime_error::what;

        // Faulty line with the faulty position marked below it
        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

        ~ParseError() noexcept override = default;

        friend class ConfigFile;
    };

    class Variable {
    public:
        static constexpr uint8_t SET = 1; // set if variable appears in the config
        static constexpr uint8_t ARRAY = 2; // set if variable is an array

    private:
        uint8_t flag_ = 0;
        std::string str_;
        std::vector<std::string> arr_;

        void unset() noexcept {
            flag_ = 0;
            str_.clear();
            arr_.clear();
        }

    public:
        Variable() {} // NOLINT(modernize-use-equals-default): compiler bug

        [[nodiscard]] bool is_set() const noexcept { return flag_ & SET; }

        [[nodiscard]] bool is_array() const noexcept { return flag_ & ARRAY; }

        template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            return str2num<T>(str_);
        }

        // Returns value as string (empty if not a string or variable isn't set)
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Returns value as array (empty if not an array or variable isn't set)
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars; // (name => value)
    static inline const Variable null_var{};

public:
    ConfigFile() = default;

    ConfigFile(const ConfigFile&) = default;
    ConfigFile(ConfigFile&&) noexcept = default;
    ConfigFile& operator=(const ConfigFile&) = default;
    ConfigFile& operator=(ConfigFile&&) noexcept = default;

    ~ConfigFile() = default;

    // Adds variables @p names to variable set, ignores duplications
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars.emplace(std::forward<Args>(names), Variable{}), ...);
    }

    // Returns a reference to a variable @p name from variable set or to a
    // null_var
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars.find(name);
        return (it != vars.end() ? it->second : null_var);
    }

    /**
     * @brief Loads config (variables) form file @p pathname
     * @details Uses load_config_from_string()
     *
     * @param pathname config file
     *
     * @errors Throws an exception std::runtime_error if an open(2) error
     *   occurs and all exceptions from load_config_from_string()
     */
    void load_config_from_file(const std::string& pathname);

    /**
     * @brief Loads config (variables) form string @p config
     * @details Syntax: one `name = value` or `name: value` per line, `#` starts
     *   a comment. A value is a string literal, a single-quoted string ('' is
     *   an escaped '), a double-quoted string (C escape sequences) or an array
     *   of these: [a, 'b', "c"], which may span many lines.
     *
     * @param config input string. Only variables from the variable set are
     *   stored, the others are parsed and ignored
     *
     * @errors Throws an exception (ParseError) if an error occurs
     */
    void load_config_from_string(std::string config);
};
