#pragma once

#include <cstdint>
#include <jailer/concat_tostr.hh>
#include <jailer/string_transform.hh>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Parser of files consisting of lines:
//   name: value
//   name = 'single quoted, '' is an escaped quote'
//   name: "double quoted with \n, \t, \x41 escapes"
//   name: [a, 'b', "c"
//       d] # arrays may span many lines
//   # comment
class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        ParseError(size_t line, size_t pos, std::string_view msg, std::string diagnostics)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", msg))
        , diagnostics_(std::move(diagnostics)) {}

        // Faulty line with the faulty character marked in the line below
        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }
    };

    class Variable {
        static constexpr uint8_t SET = 1;
        static constexpr uint8_t ARRAY = 2;

        uint8_t flag_ = 0;
        std::string str_;
        std::vector<std::string> arr_;

        void unset() noexcept {
            flag_ = 0;
            str_.clear();
            arr_.clear();
        }

    public:
        [[nodiscard]] bool is_set() const noexcept { return flag_ & SET; }

        [[nodiscard]] bool is_array() const noexcept { return flag_ & ARRAY; }

        // "1", "on", "true" (case insensitive) are true, anything else is false
        [[nodiscard]] bool as_bool() const noexcept;

        template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            return str2num<T>(str_);
        }

        // Empty if the variable is an array or is not set
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Empty if the variable is not an array or is not set
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars_;
    static const Variable null_var;

public:
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars_.emplace(std::forward<Args>(names), Variable{}), ...);
    }

    void clear() { vars_.clear(); }

    // Returns null_var if there is no variable @p name
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars_.find(name);
        return it != vars_.end() ? it->second : null_var;
    }

    [[nodiscard]] const auto& get_vars() const noexcept { return vars_; }

    // Throws std::runtime_error if the file cannot be read and everything that
    // load_config_from_string() throws
    void load_config_from_file(const char* path, bool load_all = false);

    // If @p load_all is false, only variables added by add_vars() are loaded,
    // the rest is syntax checked and ignored. Throws ParseError.
    void load_config_from_string(std::string config, bool load_all = false);

    // Quotes @p str (if needed) so that it is parsed back as the same value
    static std::string escape_string(std::string_view str);
};

inline const ConfigFile::Variable ConfigFile::null_var{};
